#include <rdfdec/token.hpp>

namespace rdfdec {

  std::string_view
  to_string(token_kind k) {
    switch (k) {
      case token_kind::eof:
        return "end of input";
      case token_kind::error:
        return "error";
      case token_kind::eol:
        return "end of line";
      case token_kind::iri_ref:
        return "IRI";
      case token_kind::blank_node_label:
        return "blank node";
      case token_kind::literal:
        return "literal";
      case token_kind::lang_tag:
        return "language tag";
      case token_kind::datatype_marker:
        return "'^^'";
      case token_kind::dot:
        return "'.'";
      case token_kind::prefixed_name:
        return "prefixed name";
      case token_kind::kw_prefix:
        return "'@prefix'";
      case token_kind::kw_base:
        return "'@base'";
      case token_kind::kw_sparql_prefix:
        return "'PREFIX'";
      case token_kind::kw_sparql_base:
        return "'BASE'";
      case token_kind::kw_a:
        return "'a'";
      case token_kind::integer:
        return "integer";
      case token_kind::decimal:
        return "decimal";
      case token_kind::double_literal:
        return "double";
      case token_kind::boolean:
        return "boolean";
      case token_kind::semicolon:
        return "';'";
      case token_kind::comma:
        return "','";
      case token_kind::lbracket:
        return "'['";
      case token_kind::rbracket:
        return "']'";
      case token_kind::lparen:
        return "'('";
      case token_kind::rparen:
        return "')'";
      case token_kind::anon:
        return "'[]'";
    }
    return "unknown token";
  }

} // namespace rdfdec
