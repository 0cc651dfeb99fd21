#pragma once

#include <rdfdec/token.hpp>

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace rdfdec {

  // Bounded lookahead over a lexer exposing `token next_token()`. Tokens are
  // pulled from the lexer only when nothing is buffered.
  template <typename Lexer>
  class token_buffer {
  public:
    static constexpr std::size_t capacity = 3;

    explicit token_buffer(Lexer lexer) : lexer_(std::move(lexer)) {}

    // Consume and return the next token.
    token
    next() {
      if (count_ == 0) return lexer_.next_token();
      token t = std::move(tokens_[head_]);
      head_ = (head_ + 1) % capacity;
      --count_;
      return t;
    }

    // Look at the n-th unconsumed token without consuming anything.
    const token&
    peek(std::size_t n = 0) {
      if (n >= capacity)
        throw std::out_of_range("token_buffer: lookahead of " +
                                std::to_string(n + 1) + " exceeds capacity");
      while (count_ <= n) {
        tokens_[(head_ + count_) % capacity] = lexer_.next_token();
        ++count_;
      }
      return tokens_[(head_ + n) % capacity];
    }

    std::size_t
    buffered() const {
      return count_;
    }

  private:
    Lexer lexer_;
    std::array<token, capacity> tokens_;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
  };

} // namespace rdfdec
