#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace rdfdec {

  enum class token_kind {
    eof,
    error, // lexical fault, text holds the diagnostic
    eol,
    iri_ref,          // <...>, text is the unescaped IRI
    blank_node_label, // _:label, text is the label
    literal,          // "...", text is the unescaped lexical form
    lang_tag,         // @en-GB, text is the tag
    datatype_marker,  // ^^
    dot,
    prefixed_name, // pname:local or pname:
    kw_prefix,     // @prefix
    kw_base,       // @base
    kw_sparql_prefix,
    kw_sparql_base,
    kw_a,
    integer,
    decimal,
    double_literal,
    boolean,
    semicolon,
    comma,
    lbracket,
    rbracket,
    lparen,
    rparen,
    anon, // []
  };

  std::string_view
  to_string(token_kind k);

  inline std::ostream&
  operator<<(std::ostream& os, token_kind k) {
    return os << to_string(k);
  }

  struct token {
    token_kind kind = token_kind::eof;
    std::string text;
    std::size_t line = 0;
    std::size_t column = 0;
  };

} // namespace rdfdec
