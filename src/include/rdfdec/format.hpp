#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rdfdec {

  enum class format {
    ntriples,
    nquads,
    turtle,
    rdfxml,
  };

  std::string_view
  to_string(format f);

  std::ostream&
  operator<<(std::ostream& os, format f);

  // Accepts the canonical names and their short forms ("nt", "nq", "ttl",
  // "rdf", "xml"), case-insensitively.
  std::optional<format>
  format_from_name(std::string_view name);

  std::optional<format>
  format_from_extension(std::string_view path);

} // namespace rdfdec
