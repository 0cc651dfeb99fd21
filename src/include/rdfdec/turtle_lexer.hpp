#pragma once

#include <rdfdec/token.hpp>

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>

namespace rdfdec {

  // Tokenizer for Turtle. Reads the stream incrementally; IRIs are returned
  // unresolved and prefixed names unexpanded, with escapes already decoded.
  class turtle_lexer {
  public:
    explicit turtle_lexer(std::istream& in);

    token
    next_token();

  private:
    std::istream* in_;
    std::string buf_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    bool exhausted_ = false;

    // Start of the token being lexed.
    std::size_t token_line_ = 1;
    std::size_t token_column_ = 1;

    bool
    fill(std::size_t n);

    int
    peek_char(std::size_t n = 0);

    char
    get_char();

    bool
    match(std::string_view s);

    void
    skip_whitespace_and_comments();

    token
    make(token_kind kind, std::string text) const;

    token
    error(std::string message) const;

    token
    lex_iri();

    token
    lex_string(char quote);

    token
    lex_long_string(char quote);

    bool
    lex_escape(std::string& out, bool allow_echar, std::string& problem);

    token
    lex_at_keyword_or_lang();

    token
    lex_blank_node_label();

    token
    lex_number();

    token
    lex_name();

    bool
    lex_local_name(std::string& out, std::string& problem);
  };

} // namespace rdfdec
