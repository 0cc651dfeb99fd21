#include <rdfdec/turtle_lexer.hpp>

#include "lex_util.hpp"

#include <cctype>
#include <string_view>
#include <utility>

namespace rdfdec {

  namespace {

    constexpr std::size_t read_chunk = 4096;

    bool
    is_digit(int c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_name_char(int c) {
      return c >= 0 && detail::is_pn_chars(static_cast<char>(c));
    }

    bool
    is_hex(int c) {
      return c >= 0 && std::isxdigit(c);
    }

    // Characters a local name may escape with a backslash.
    bool
    is_local_escapable(int c) {
      return c >= 0 &&
             std::string_view("_~.-!$&'()*+,;=/?#@%").find(
                 static_cast<char>(c)) != std::string_view::npos;
    }

  } // namespace

  turtle_lexer::turtle_lexer(std::istream& in) : in_(&in) {}

  bool
  turtle_lexer::fill(std::size_t n) {
    while (buf_.size() - pos_ < n && !exhausted_) {
      if (pos_ > 0 && pos_ >= buf_.size() / 2) {
        buf_.erase(0, pos_);
        pos_ = 0;
      }
      char chunk[read_chunk];
      in_->read(chunk, sizeof chunk);
      auto got = in_->gcount();
      if (got <= 0) {
        exhausted_ = true;
        break;
      }
      buf_.append(chunk, static_cast<std::size_t>(got));
    }
    return buf_.size() - pos_ >= n;
  }

  int
  turtle_lexer::peek_char(std::size_t n) {
    if (!fill(n + 1)) return -1;
    return static_cast<unsigned char>(buf_[pos_ + n]);
  }

  char
  turtle_lexer::get_char() {
    fill(1);
    char c = buf_[pos_++];
    if (c == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    return c;
  }

  bool
  turtle_lexer::match(std::string_view s) {
    for (std::size_t i = 0; i < s.size(); ++i) {
      if (peek_char(i) != static_cast<unsigned char>(s[i])) return false;
    }
    for (std::size_t i = 0; i < s.size(); ++i)
      get_char();
    return true;
  }

  void
  turtle_lexer::skip_whitespace_and_comments() {
    while (true) {
      int c = peek_char();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        get_char();
      } else if (c == '#') {
        while (peek_char() >= 0 && peek_char() != '\n')
          get_char();
      } else {
        return;
      }
    }
  }

  token
  turtle_lexer::make(token_kind kind, std::string text) const {
    return token{kind, std::move(text), token_line_, token_column_};
  }

  token
  turtle_lexer::error(std::string message) const {
    return make(token_kind::error, std::move(message));
  }

  token
  turtle_lexer::next_token() {
    skip_whitespace_and_comments();
    token_line_ = line_;
    token_column_ = column_;

    int c = peek_char();
    if (c < 0) return make(token_kind::eof, "");

    switch (c) {
      case '<':
        return lex_iri();
      case '"':
      case '\'':
        if (peek_char(1) == c && peek_char(2) == c)
          return lex_long_string(static_cast<char>(c));
        return lex_string(static_cast<char>(c));
      case '@':
        return lex_at_keyword_or_lang();
      case '^':
        if (match("^^")) return make(token_kind::datatype_marker, "^^");
        get_char();
        return error("expected '^^', got '^'");
      case '_':
        if (peek_char(1) == ':') return lex_blank_node_label();
        break;
      case '[':
        get_char();
        skip_whitespace_and_comments();
        if (match("]")) return make(token_kind::anon, "[]");
        return make(token_kind::lbracket, "[");
      case ']':
        get_char();
        return make(token_kind::rbracket, "]");
      case '(':
        get_char();
        return make(token_kind::lparen, "(");
      case ')':
        get_char();
        return make(token_kind::rparen, ")");
      case ';':
        get_char();
        return make(token_kind::semicolon, ";");
      case ',':
        get_char();
        return make(token_kind::comma, ",");
      case '.':
        if (is_digit(peek_char(1))) return lex_number();
        get_char();
        return make(token_kind::dot, ".");
      case '+':
      case '-':
        return lex_number();
      default:
        break;
    }

    if (is_digit(c)) return lex_number();
    if (c == ':' || detail::is_pn_chars_base(static_cast<char>(c)))
      return lex_name();

    std::string text(1, get_char());
    return error("unexpected character '" + text + "'");
  }

  token
  turtle_lexer::lex_iri() {
    get_char(); // consume '<'
    std::string value;
    while (true) {
      int c = peek_char();
      if (c < 0 || c == '\n') return error("unterminated IRI: <" + value);
      char ch = get_char();
      if (ch == '>') return make(token_kind::iri_ref, std::move(value));
      if (ch == '\\') {
        std::string problem;
        if (!lex_escape(value, false, problem))
          return error("invalid escape '" + problem + "' in IRI: <" + value);
        continue;
      }
      if (detail::is_iri_forbidden(ch))
        return error("invalid character '" + std::string(1, ch) +
                     "' in IRI: <" + value);
      value += ch;
    }
  }

  bool
  turtle_lexer::lex_escape(std::string& out, bool allow_echar,
                           std::string& problem) {
    int e = peek_char();
    if (e == 'u' || e == 'U') {
      get_char();
      std::size_t n = e == 'u' ? 4 : 8;
      std::string digits;
      while (digits.size() < n && is_hex(peek_char()))
        digits += get_char();
      std::optional<uint32_t> cp;
      if (digits.size() == n) cp = detail::decode_hex(digits);
      if (!cp) {
        problem = "\\" + std::string(1, static_cast<char>(e)) + digits;
        return false;
      }
      detail::append_utf8(out, *cp);
      return true;
    }
    if (allow_echar && e >= 0) {
      if (auto unescaped = detail::unescape_echar(static_cast<char>(e))) {
        get_char();
        out += *unescaped;
        return true;
      }
    }
    problem = "\\";
    if (e >= 0 && e != '\n') problem += get_char();
    return false;
  }

  token
  turtle_lexer::lex_string(char quote) {
    get_char(); // consume opening quote
    std::string value;
    while (true) {
      int c = peek_char();
      if (c < 0 || c == '\n' || c == '\r')
        return error("unterminated string: " + std::string(1, quote) + value);
      char ch = get_char();
      if (ch == quote) return make(token_kind::literal, std::move(value));
      if (ch == '\\') {
        std::string problem;
        if (!lex_escape(value, true, problem))
          return error("invalid escape '" + problem + "' in string");
        continue;
      }
      value += ch;
    }
  }

  token
  turtle_lexer::lex_long_string(char quote) {
    for (int i = 0; i < 3; ++i)
      get_char();
    std::string value;
    while (true) {
      int c = peek_char();
      if (c < 0)
        return error("unterminated long string: " + std::string(3, quote) +
                     value);
      if (c == quote && peek_char(1) == quote && peek_char(2) == quote) {
        // Up to two quotes may end the content right before the delimiter.
        if (peek_char(3) == quote) {
          value += get_char();
          continue;
        }
        for (int i = 0; i < 3; ++i)
          get_char();
        return make(token_kind::literal, std::move(value));
      }
      char ch = get_char();
      if (ch == '\\') {
        std::string problem;
        if (!lex_escape(value, true, problem))
          return error("invalid escape '" + problem + "' in string");
        continue;
      }
      value += ch;
    }
  }

  token
  turtle_lexer::lex_at_keyword_or_lang() {
    get_char(); // consume '@'
    std::string tag;
    while (peek_char() >= 0 &&
           detail::is_lang_start(static_cast<char>(peek_char())))
      tag += get_char();
    if (tag.empty()) return error("invalid language tag: @");
    if ((tag == "prefix" || tag == "base") && peek_char() != '-')
      return make(tag == "prefix" ? token_kind::kw_prefix : token_kind::kw_base,
                  "@" + tag);
    while (peek_char() == '-') {
      tag += get_char();
      auto before = tag.size();
      while (peek_char() >= 0 && (std::isalnum(peek_char())))
        tag += get_char();
      if (tag.size() == before) return error("invalid language tag: @" + tag);
    }
    return make(token_kind::lang_tag, std::move(tag));
  }

  token
  turtle_lexer::lex_blank_node_label() {
    get_char(); // '_'
    get_char(); // ':'
    int c = peek_char();
    if (c < 0 ||
        !(detail::is_pn_chars_u(static_cast<char>(c)) || is_digit(c)))
      return error("invalid blank node label: _:");

    std::string label(1, get_char());
    while (true) {
      c = peek_char();
      if (is_name_char(c)) {
        label += get_char();
        continue;
      }
      if (c == '.') {
        // Dots inside a label only; a trailing dot ends the statement.
        std::size_t n = 1;
        while (peek_char(n) == '.')
          ++n;
        if (is_name_char(peek_char(n))) {
          for (std::size_t i = 0; i < n; ++i)
            label += get_char();
          continue;
        }
      }
      break;
    }
    return make(token_kind::blank_node_label, std::move(label));
  }

  token
  turtle_lexer::lex_number() {
    std::string text;
    if (peek_char() == '+' || peek_char() == '-') text += get_char();

    bool digits = false;
    while (is_digit(peek_char())) {
      text += get_char();
      digits = true;
    }

    auto exponent_at = [this](std::size_t n) {
      int e = peek_char(n);
      if (e != 'e' && e != 'E') return false;
      int s = peek_char(n + 1);
      if (s == '+' || s == '-') return is_digit(peek_char(n + 2));
      return is_digit(s);
    };
    auto lex_exponent = [this, &text]() {
      text += get_char();
      if (peek_char() == '+' || peek_char() == '-') text += get_char();
      while (is_digit(peek_char()))
        text += get_char();
    };

    bool fraction = false;
    if (peek_char() == '.' && is_digit(peek_char(1))) {
      text += get_char();
      while (is_digit(peek_char()))
        text += get_char();
      fraction = true;
      digits = true;
    } else if (digits && peek_char() == '.' && exponent_at(1)) {
      text += get_char();
    }

    if (!digits) return error("invalid number: " + text);

    if (exponent_at(0)) {
      lex_exponent();
      return make(token_kind::double_literal, std::move(text));
    }
    return make(fraction ? token_kind::decimal : token_kind::integer,
                std::move(text));
  }

  token
  turtle_lexer::lex_name() {
    std::string prefix;
    if (peek_char() != ':') {
      prefix += get_char();
      while (true) {
        int c = peek_char();
        if (is_name_char(c)) {
          prefix += get_char();
          continue;
        }
        if (c == '.') {
          std::size_t n = 1;
          while (peek_char(n) == '.')
            ++n;
          if (is_name_char(peek_char(n))) {
            for (std::size_t i = 0; i < n; ++i)
              prefix += get_char();
            continue;
          }
        }
        break;
      }
    }

    if (peek_char() == ':') {
      get_char();
      std::string local;
      std::string problem;
      if (!lex_local_name(local, problem))
        return error("invalid local name '" + prefix + ":" + local +
                     "': " + problem);
      return make(token_kind::prefixed_name, prefix + ":" + local);
    }

    if (prefix == "a") return make(token_kind::kw_a, "a");
    if (prefix == "true" || prefix == "false")
      return make(token_kind::boolean, std::move(prefix));

    std::string upper;
    for (char c : prefix)
      upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper == "PREFIX")
      return make(token_kind::kw_sparql_prefix, std::move(prefix));
    if (upper == "BASE")
      return make(token_kind::kw_sparql_base, std::move(prefix));

    return error("unexpected name '" + prefix + "'");
  }

  bool
  turtle_lexer::lex_local_name(std::string& out, std::string& problem) {
    auto is_local_char = [](int c) { return is_name_char(c) || c == ':'; };

    // One character, percent escape or backslash escape.
    auto lex_unit = [&]() {
      int c = peek_char();
      if (c == '%') {
        if (!is_hex(peek_char(1)) || !is_hex(peek_char(2))) {
          problem = "invalid percent escape";
          return false;
        }
        for (int i = 0; i < 3; ++i)
          out += get_char();
        return true;
      }
      if (c == '\\') {
        get_char();
        if (!is_local_escapable(peek_char())) {
          problem = "invalid escape in local name";
          return false;
        }
        out += get_char();
        return true;
      }
      out += get_char();
      return true;
    };

    int c = peek_char();
    bool starts = c >= 0 && (detail::is_pn_chars_u(static_cast<char>(c)) ||
                             c == ':' || is_digit(c) || c == '%' || c == '\\');
    if (!starts) return true;
    if (!lex_unit()) return false;

    while (true) {
      c = peek_char();
      if (is_local_char(c) || c == '%' || c == '\\') {
        if (!lex_unit()) return false;
        continue;
      }
      if (c == '.') {
        std::size_t n = 1;
        while (peek_char(n) == '.')
          ++n;
        int after = peek_char(n);
        if (is_local_char(after) || after == '%' || after == '\\') {
          for (std::size_t i = 0; i < n; ++i)
            out += get_char();
          continue;
        }
      }
      return true;
    }
  }

} // namespace rdfdec
