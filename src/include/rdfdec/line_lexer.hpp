#pragma once

#include <rdfdec/token.hpp>

#include <cstddef>
#include <istream>
#include <string>

namespace rdfdec {

  // Tokenizer for the line-oriented grammars (N-Triples, N-Quads). Emits an
  // eol token at the end of every line and eof once the stream is exhausted;
  // asking again after eof keeps returning eof.
  class line_lexer {
  public:
    explicit line_lexer(std::istream& in);

    token
    next_token();

  private:
    std::istream* in_;
    std::string line_;
    std::size_t line_number_ = 0;
    std::size_t pos_ = 0;
    bool have_line_ = false;
    bool at_eof_ = false;

    token
    make(token_kind kind, std::string text, std::size_t start) const;

    token
    error(std::string message, std::size_t start);

    token
    lex_iri();

    token
    lex_blank_node_label();

    token
    lex_literal();

    token
    lex_lang_tag();
  };

} // namespace rdfdec
