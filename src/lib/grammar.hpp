#pragma once

#include <rdfdec/errors.hpp>
#include <rdfdec/term.hpp>
#include <rdfdec/token.hpp>

#include <initializer_list>
#include <string>
#include <string_view>

namespace rdfdec::detail {

  // Terminates the current parse: error tokens become lexical faults, any
  // other token a syntax fault naming the expected context.
  [[noreturn]] inline void
  unexpected(const token& t, std::string_view context) {
    if (t.kind == token_kind::error)
      throw parse_error(lexical_fault(t.line, t.column, t.text));
    throw parse_error(unexpected_token_fault(t, std::string(context)));
  }

  // Consume the next token and guarantee it has one of the expected kinds.
  template <typename Buffer>
  token
  expect(Buffer& tokens, std::string_view context,
         std::initializer_list<token_kind> expected) {
    token t = tokens.next();
    for (auto k : expected) {
      if (t.kind == k) return t;
    }
    unexpected(t, context);
  }

  // Consume the next token if it has the given kind.
  template <typename Buffer>
  bool
  accept(Buffer& tokens, token_kind kind) {
    if (tokens.peek().kind != kind) return false;
    tokens.next();
    return true;
  }

} // namespace rdfdec::detail
