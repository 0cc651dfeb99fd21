#include <rdfdec/format.hpp>

#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace rdfdec {

  namespace {

    std::string
    lowercase(std::string_view s) {
      std::string result;
      result.reserve(s.size());
      for (char c : s)
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      return result;
    }

    const std::array<std::pair<std::string_view, format>, 10> format_names = {{
        {"ntriples", format::ntriples},
        {"nt", format::ntriples},
        {"nquads", format::nquads},
        {"nq", format::nquads},
        {"turtle", format::turtle},
        {"ttl", format::turtle},
        {"rdfxml", format::rdfxml},
        {"rdf/xml", format::rdfxml},
        {"rdf", format::rdfxml},
        {"xml", format::rdfxml},
    }};

    const std::array<std::pair<std::string_view, format>, 6> extensions = {{
        {".nt", format::ntriples},
        {".nq", format::nquads},
        {".ttl", format::turtle},
        {".rdf", format::rdfxml},
        {".owl", format::rdfxml},
        {".xml", format::rdfxml},
    }};

  } // namespace

  std::string_view
  to_string(format f) {
    switch (f) {
      case format::ntriples:
        return "N-Triples";
      case format::nquads:
        return "N-Quads";
      case format::turtle:
        return "Turtle";
      case format::rdfxml:
        return "RDF/XML";
    }
    return "unknown";
  }

  std::ostream&
  operator<<(std::ostream& os, format f) {
    return os << to_string(f);
  }

  std::optional<format>
  format_from_name(std::string_view name) {
    auto key = lowercase(name);
    for (const auto& [n, f] : format_names) {
      if (key == n) return f;
    }
    return std::nullopt;
  }

  std::optional<format>
  format_from_extension(std::string_view path) {
    auto lower = lowercase(path);
    for (const auto& [ext, f] : extensions) {
      if (lower.ends_with(ext)) return f;
    }
    return std::nullopt;
  }

} // namespace rdfdec
