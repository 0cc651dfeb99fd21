#include "nquads_parser.hpp"

#include "grammar.hpp"

#include <utility>

namespace rdfdec::detail {

  namespace {

    resource
    to_resource(token t) {
      if (t.kind == token_kind::blank_node_label)
        return blank_node(std::move(t.text));
      return iri(std::move(t.text));
    }

  } // namespace

  nquads_parser::nquads_parser(std::istream& in, bool allow_graph_label,
                               blank_node default_graph)
      : tokens_(line_lexer(in)), allow_graph_label_(allow_graph_label),
        default_graph_(std::move(default_graph)) {}

  std::optional<quad>
  nquads_parser::parse() {
    while (tokens_.peek().kind == token_kind::eol)
      tokens_.next();
    // End of input stays buffered so later calls see it again.
    if (tokens_.peek().kind == token_kind::eof) return std::nullopt;

    quad q;
    q.subject = parse_resource("subject");
    q.predicate =
        iri(expect(tokens_, "predicate", {token_kind::iri_ref}).text);
    q.object = parse_object();

    auto next = tokens_.peek().kind;
    if (allow_graph_label_ && (next == token_kind::iri_ref ||
                               next == token_kind::blank_node_label)) {
      q.context = parse_resource("graph label");
    } else {
      q.context = default_graph_;
    }

    expect(tokens_, "dot", {token_kind::dot});
    if (tokens_.peek().kind != token_kind::eof)
      expect(tokens_, "end of line", {token_kind::eol});
    return q;
  }

  resource
  nquads_parser::parse_resource(const char* context) {
    return to_resource(expect(tokens_, context,
                              {token_kind::iri_ref,
                               token_kind::blank_node_label}));
  }

  term
  nquads_parser::parse_object() {
    token t = expect(tokens_, "object",
                     {token_kind::iri_ref, token_kind::blank_node_label,
                      token_kind::literal});
    if (t.kind != token_kind::literal) return to_term(to_resource(std::move(t)));

    if (tokens_.peek().kind == token_kind::lang_tag)
      return literal(std::move(t.text), tokens_.next().text);
    if (accept(tokens_, token_kind::datatype_marker)) {
      auto dt = expect(tokens_, "datatype", {token_kind::iri_ref});
      return literal(std::move(t.text), iri(std::move(dt.text)));
    }
    return literal(std::move(t.text));
  }

} // namespace rdfdec::detail
