#pragma once

#include <rdfdec/token.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rdfdec {

  enum class fault_kind {
    lexical, // the lexer could not classify a lexeme
    syntax,  // a token of the wrong kind in a grammar position
  };

  std::string_view
  to_string(fault_kind k);

  // An input-driven decoding failure. The message always starts with
  // "line:column:".
  struct fault {
    fault_kind kind = fault_kind::syntax;
    std::size_t line = 0;
    std::size_t column = 0;
    std::string context;
    std::optional<token_kind> found;
    std::string text;
    std::string message;

    friend std::ostream&
    operator<<(std::ostream& os, const fault& f) {
      return os << f.message;
    }
  };

  fault
  lexical_fault(std::size_t line, std::size_t column, std::string text);

  fault
  unexpected_token_fault(const token& found, std::string context);

  fault
  syntax_fault(std::size_t line, std::size_t column, std::string context,
               std::string description);

  // Raised inside grammar code and caught once per decode() call.
  class parse_error : public std::runtime_error {
    fault fault_;

  public:
    explicit parse_error(fault f)
        : std::runtime_error(f.message), fault_(std::move(f)) {}

    const fault&
    details() const noexcept {
      return fault_;
    }
  };

  // An unsupported serialization format requested at construction.
  class configuration_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace rdfdec
