#include <rdfdec/errors.hpp>

#include <utility>

namespace rdfdec {

  namespace {

    std::string
    position(std::size_t line, std::size_t column) {
      return std::to_string(line) + ":" + std::to_string(column) + ": ";
    }

  } // namespace

  std::string_view
  to_string(fault_kind k) {
    switch (k) {
      case fault_kind::lexical:
        return "lexical fault";
      case fault_kind::syntax:
        return "syntax fault";
    }
    return "fault";
  }

  fault
  lexical_fault(std::size_t line, std::size_t column, std::string text) {
    fault f;
    f.kind = fault_kind::lexical;
    f.line = line;
    f.column = column;
    f.message = position(line, column) + "syntax error: " + text;
    f.text = std::move(text);
    return f;
  }

  fault
  unexpected_token_fault(const token& found, std::string context) {
    fault f;
    f.kind = fault_kind::syntax;
    f.line = found.line;
    f.column = found.column;
    f.found = found.kind;
    f.text = found.text;
    f.message = position(found.line, found.column) + "unexpected " +
                std::string(to_string(found.kind)) + " while expecting " +
                context;
    f.context = std::move(context);
    return f;
  }

  fault
  syntax_fault(std::size_t line, std::size_t column, std::string context,
               std::string description) {
    fault f;
    f.kind = fault_kind::syntax;
    f.line = line;
    f.column = column;
    f.message = position(line, column) + description;
    f.text = std::move(description);
    f.context = std::move(context);
    return f;
  }

} // namespace rdfdec
