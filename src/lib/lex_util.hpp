#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rdfdec::detail {

  inline void
  append_utf8(std::string& out, uint32_t cp) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  // Decode exactly `digits.size()` hex digits, or nothing.
  inline std::optional<uint32_t>
  decode_hex(std::string_view digits) {
    uint32_t value = 0;
    for (char c : digits) {
      uint32_t v;
      if (c >= '0' && c <= '9')
        v = static_cast<uint32_t>(c - '0');
      else if (c >= 'A' && c <= 'F')
        v = static_cast<uint32_t>(c - 'A' + 10);
      else if (c >= 'a' && c <= 'f')
        v = static_cast<uint32_t>(c - 'a' + 10);
      else
        return std::nullopt;
      value = (value << 4) | v;
    }
    if (value > 0x10FFFF) return std::nullopt;
    if (value >= 0xD800 && value <= 0xDFFF) return std::nullopt;
    return value;
  }

  // The character an ECHAR escape (after the backslash) stands for.
  inline std::optional<char>
  unescape_echar(char c) {
    switch (c) {
      case 't':
        return '\t';
      case 'b':
        return '\b';
      case 'n':
        return '\n';
      case 'r':
        return '\r';
      case 'f':
        return '\f';
      case '"':
        return '"';
      case '\'':
        return '\'';
      case '\\':
        return '\\';
      default:
        return std::nullopt;
    }
  }

  // Non-ASCII bytes are accepted as name characters without validating the
  // code point ranges of the grammar.
  inline bool
  is_pn_chars_base(char c) {
    auto u = static_cast<unsigned char>(c);
    return (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || u >= 0x80;
  }

  inline bool
  is_pn_chars_u(char c) {
    return is_pn_chars_base(c) || c == '_';
  }

  inline bool
  is_digit(char c) {
    return c >= '0' && c <= '9';
  }

  inline bool
  is_pn_chars(char c) {
    return is_pn_chars_u(c) || is_digit(c) || c == '-';
  }

  inline bool
  is_iri_forbidden(char c) {
    auto u = static_cast<unsigned char>(c);
    if (u <= 0x20) return true;
    switch (c) {
      case '<':
      case '>':
      case '"':
      case '{':
      case '}':
      case '|':
      case '^':
      case '`':
        return true;
      default:
        return false;
    }
  }

  inline bool
  is_lang_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
  }

} // namespace rdfdec::detail
