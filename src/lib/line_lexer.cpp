#include <rdfdec/line_lexer.hpp>

#include <rdfdec/iri.hpp>

#include "lex_util.hpp"

#include <utility>

namespace rdfdec {

  line_lexer::line_lexer(std::istream& in) : in_(&in) {}

  token
  line_lexer::make(token_kind kind, std::string text, std::size_t start) const {
    return token{kind, std::move(text), line_number_, start + 1};
  }

  token
  line_lexer::error(std::string message, std::size_t start) {
    return make(token_kind::error, std::move(message), start);
  }

  token
  line_lexer::next_token() {
    if (!have_line_) {
      if (at_eof_ || !std::getline(*in_, line_)) {
        at_eof_ = true;
        if (line_number_ == 0) return token{token_kind::eof, "", 1, 1};
        return token{token_kind::eof, "", line_number_, line_.size() + 1};
      }
      ++line_number_;
      if (!line_.empty() && line_.back() == '\r') line_.pop_back();
      pos_ = 0;
      have_line_ = true;
    }

    while (pos_ < line_.size() && (line_[pos_] == ' ' || line_[pos_] == '\t'))
      ++pos_;

    // Comments run to the end of the line.
    if (pos_ >= line_.size() || line_[pos_] == '#') {
      have_line_ = false;
      auto start = pos_;
      pos_ = line_.size();
      return make(token_kind::eol, "", start);
    }

    char c = line_[pos_];
    switch (c) {
      case '<':
        return lex_iri();
      case '"':
        return lex_literal();
      case '@':
        return lex_lang_tag();
      case '.':
        ++pos_;
        return make(token_kind::dot, ".", pos_ - 1);
      case '^': {
        auto start = pos_;
        if (pos_ + 1 < line_.size() && line_[pos_ + 1] == '^') {
          pos_ += 2;
          return make(token_kind::datatype_marker, "^^", start);
        }
        ++pos_;
        return error("expected '^^', got '^'", start);
      }
      case '_':
        if (pos_ + 1 < line_.size() && line_[pos_ + 1] == ':')
          return lex_blank_node_label();
        break;
      default:
        break;
    }

    auto start = pos_;
    while (pos_ < line_.size() && line_[pos_] != ' ' && line_[pos_] != '\t')
      ++pos_;
    return error("unexpected input '" + line_.substr(start, pos_ - start) +
                     "'",
                 start);
  }

  token
  line_lexer::lex_iri() {
    auto start = pos_;
    ++pos_; // consume '<'
    std::string value;
    while (pos_ < line_.size()) {
      char c = line_[pos_];
      if (c == '>') {
        ++pos_;
        if (!is_absolute_iri(value)) {
          auto end = pos_;
          pos_ = line_.size();
          return error("relative IRI not allowed: " +
                           line_.substr(start, end - start),
                       start);
        }
        return make(token_kind::iri_ref, std::move(value), start);
      }
      if (c == '\\') {
        char kind = pos_ + 1 < line_.size() ? line_[pos_ + 1] : '\0';
        std::size_t digits = kind == 'u' ? 4 : kind == 'U' ? 8 : 0;
        std::optional<uint32_t> cp;
        if (digits != 0 && pos_ + 2 + digits <= line_.size())
          cp = detail::decode_hex(
              std::string_view(line_).substr(pos_ + 2, digits));
        if (!cp) {
          pos_ = line_.size();
          return error("invalid escape in IRI: " + line_.substr(start), start);
        }
        detail::append_utf8(value, *cp);
        pos_ += 2 + digits;
        continue;
      }
      if (detail::is_iri_forbidden(c)) {
        auto end = pos_ + 1;
        pos_ = line_.size();
        return error("invalid character '" + std::string(1, c) +
                         "' in IRI: " + line_.substr(start, end - start),
                     start);
      }
      value += c;
      ++pos_;
    }
    return error("unterminated IRI: " + line_.substr(start), start);
  }

  token
  line_lexer::lex_blank_node_label() {
    auto start = pos_;
    pos_ += 2; // consume "_:"
    auto label_start = pos_;
    if (pos_ < line_.size() &&
        (detail::is_pn_chars_u(line_[pos_]) || detail::is_digit(line_[pos_]))) {
      ++pos_;
      while (pos_ < line_.size() &&
             (detail::is_pn_chars(line_[pos_]) || line_[pos_] == '.'))
        ++pos_;
      // A label never ends with '.', which belongs to the statement.
      while (line_[pos_ - 1] == '.')
        --pos_;
    }
    if (pos_ == label_start) {
      while (pos_ < line_.size() && line_[pos_] != ' ' && line_[pos_] != '\t')
        ++pos_;
      return error("invalid blank node label: " +
                       line_.substr(start, pos_ - start),
                   start);
    }
    return make(token_kind::blank_node_label,
                line_.substr(label_start, pos_ - label_start), start);
  }

  token
  line_lexer::lex_literal() {
    auto start = pos_;
    ++pos_; // consume opening quote
    std::string value;
    while (pos_ < line_.size()) {
      char c = line_[pos_];
      if (c == '"') {
        ++pos_;
        return make(token_kind::literal, std::move(value), start);
      }
      if (c == '\\') {
        if (pos_ + 1 >= line_.size()) break;
        char e = line_[pos_ + 1];
        if (e == 'u' || e == 'U') {
          std::size_t digits = e == 'u' ? 4 : 8;
          std::optional<uint32_t> cp;
          if (pos_ + 2 + digits <= line_.size())
            cp = detail::decode_hex(
                std::string_view(line_).substr(pos_ + 2, digits));
          if (!cp) {
            pos_ = line_.size();
            return error("invalid escape in literal: " + line_.substr(start),
                         start);
          }
          detail::append_utf8(value, *cp);
          pos_ += 2 + digits;
          continue;
        }
        auto unescaped = detail::unescape_echar(e);
        if (!unescaped) {
          pos_ = line_.size();
          return error("invalid escape '\\" + std::string(1, e) +
                           "' in literal: " + line_.substr(start),
                       start);
        }
        value += *unescaped;
        pos_ += 2;
        continue;
      }
      value += c;
      ++pos_;
    }
    pos_ = line_.size();
    return error("unterminated literal: " + line_.substr(start), start);
  }

  token
  line_lexer::lex_lang_tag() {
    auto start = pos_;
    ++pos_; // consume '@'
    auto tag_start = pos_;
    bool valid = pos_ < line_.size() && detail::is_lang_start(line_[pos_]);
    while (pos_ < line_.size() && detail::is_lang_start(line_[pos_]))
      ++pos_;
    while (valid && pos_ < line_.size() && line_[pos_] == '-') {
      ++pos_;
      auto subtag = pos_;
      while (pos_ < line_.size() && (detail::is_lang_start(line_[pos_]) ||
                                     detail::is_digit(line_[pos_])))
        ++pos_;
      if (pos_ == subtag) valid = false;
    }
    if (!valid) {
      while (pos_ < line_.size() && line_[pos_] != ' ' && line_[pos_] != '\t')
        ++pos_;
      return error("invalid language tag: " + line_.substr(start, pos_ - start),
                   start);
    }
    return make(token_kind::lang_tag, line_.substr(tag_start, pos_ - tag_start),
                start);
  }

} // namespace rdfdec
