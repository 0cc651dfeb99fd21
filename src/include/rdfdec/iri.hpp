#pragma once

#include <string>
#include <string_view>

namespace rdfdec {

  // True when the reference starts with a scheme ("http:", "urn:", ...).
  bool
  is_absolute_iri(std::string_view ref);

  // Resolve a reference against a base IRI (RFC 3986 section 5.2). An empty
  // base leaves the reference unchanged.
  std::string
  resolve_iri(std::string_view base, std::string_view ref);

} // namespace rdfdec
