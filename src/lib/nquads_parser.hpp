#pragma once

#include <rdfdec/line_lexer.hpp>
#include <rdfdec/term.hpp>
#include <rdfdec/token_buffer.hpp>

#include <istream>
#include <optional>

namespace rdfdec::detail {

  // Statement grammar shared by N-Quads and N-Triples; the latter admits no
  // graph label.
  class nquads_parser {
  public:
    nquads_parser(std::istream& in, bool allow_graph_label,
                  blank_node default_graph);

    // The next statement, or nothing at end of input. Throws parse_error.
    std::optional<quad>
    parse();

    const blank_node&
    default_graph() const {
      return default_graph_;
    }

  private:
    token_buffer<line_lexer> tokens_;
    bool allow_graph_label_;
    blank_node default_graph_;

    resource
    parse_resource(const char* context);

    term
    parse_object();
  };

} // namespace rdfdec::detail
