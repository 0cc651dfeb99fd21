#include <rdfdec/term.hpp>

#include <sstream>
#include <stdexcept>

namespace rdfdec {

  namespace {

    // Quote a lexical form the way N-Triples writes it, for diagnostics.
    void
    write_quoted(std::ostream& os, const std::string& s) {
      os << '"';
      for (char c : s) {
        switch (c) {
          case '"':
            os << "\\\"";
            break;
          case '\\':
            os << "\\\\";
            break;
          case '\n':
            os << "\\n";
            break;
          case '\r':
            os << "\\r";
            break;
          case '\t':
            os << "\\t";
            break;
          default:
            os << c;
        }
      }
      os << '"';
    }

    template <typename Variant>
    std::string
    variant_to_string(const Variant& v) {
      std::ostringstream ss;
      std::visit([&ss](const auto& alt) { ss << alt; }, v);
      return ss.str();
    }

  } // namespace

  literal::literal(std::string lexical, std::string language)
      : lexical_(std::move(lexical)), language_(std::move(language)) {
    if (language_.empty())
      throw std::invalid_argument("literal: empty language tag");
  }

  std::ostream&
  operator<<(std::ostream& os, const literal& l) {
    write_quoted(os, l.lexical_);
    if (!l.language_.empty()) return os << '@' << l.language_;
    if (l.datatype_) return os << "^^" << *l.datatype_;
    return os;
  }

  term
  to_term(const resource& r) {
    return std::visit([](const auto& alt) -> term { return alt; }, r);
  }

  std::string
  to_string(const term& t) {
    return variant_to_string(t);
  }

  std::string
  to_string(const resource& r) {
    return variant_to_string(r);
  }

  std::ostream&
  operator<<(std::ostream& os, const triple& t) {
    return os << to_string(t.subject) << ' ' << t.predicate << ' '
              << to_string(t.object) << " .";
  }

  std::ostream&
  operator<<(std::ostream& os, const quad& q) {
    os << to_string(q.subject) << ' ' << q.predicate << ' '
       << to_string(q.object);
    if (!(std::holds_alternative<blank_node>(q.context) &&
          std::get<blank_node>(q.context).is_default_graph()))
      os << ' ' << to_string(q.context);
    return os << " .";
  }

} // namespace rdfdec
