#include <rdfdec/iri.hpp>

#include <cctype>
#include <optional>

namespace rdfdec {

  namespace {

    struct iri_parts {
      std::optional<std::string_view> scheme;
      std::optional<std::string_view> authority;
      std::string_view path;
      std::optional<std::string_view> query;
      std::optional<std::string_view> fragment;
    };

    std::size_t
    scheme_length(std::string_view ref) {
      if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref[0])))
        return 0;
      for (std::size_t i = 1; i < ref.size(); ++i) {
        char c = ref[i];
        if (c == ':') return i;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' &&
            c != '-' && c != '.')
          return 0;
      }
      return 0;
    }

    iri_parts
    split(std::string_view s) {
      iri_parts parts;
      if (auto n = scheme_length(s); n > 0) {
        parts.scheme = s.substr(0, n);
        s.remove_prefix(n + 1);
      }
      if (auto hash = s.find('#'); hash != std::string_view::npos) {
        parts.fragment = s.substr(hash + 1);
        s = s.substr(0, hash);
      }
      if (auto q = s.find('?'); q != std::string_view::npos) {
        parts.query = s.substr(q + 1);
        s = s.substr(0, q);
      }
      if (s.starts_with("//")) {
        s.remove_prefix(2);
        auto slash = s.find('/');
        parts.authority = s.substr(0, slash);
        s = slash == std::string_view::npos ? std::string_view{}
                                            : s.substr(slash);
      }
      parts.path = s;
      return parts;
    }

    // RFC 3986 section 5.2.4.
    std::string
    remove_dot_segments(std::string_view input) {
      std::string output;
      while (!input.empty()) {
        if (input.starts_with("../")) {
          input.remove_prefix(3);
        } else if (input.starts_with("./")) {
          input.remove_prefix(2);
        } else if (input.starts_with("/./")) {
          input.remove_prefix(2);
        } else if (input == "/.") {
          input = "/";
        } else if (input.starts_with("/../") || input == "/..") {
          input = input.size() == 3 ? std::string_view("/") : input.substr(3);
          auto last = output.rfind('/');
          output.erase(last == std::string::npos ? 0 : last);
        } else if (input == "." || input == "..") {
          input = {};
        } else {
          auto next = input.find('/', input[0] == '/' ? 1 : 0);
          auto segment = input.substr(0, next);
          output += segment;
          input.remove_prefix(segment.size());
        }
      }
      return output;
    }

    // RFC 3986 section 5.2.3.
    std::string
    merge(const iri_parts& base, std::string_view ref_path) {
      if (base.authority && base.path.empty())
        return "/" + std::string(ref_path);
      auto slash = base.path.rfind('/');
      if (slash == std::string_view::npos) return std::string(ref_path);
      return std::string(base.path.substr(0, slash + 1)) +
             std::string(ref_path);
    }

    std::string
    recompose(const std::optional<std::string_view>& scheme,
              const std::optional<std::string_view>& authority,
              const std::string& path,
              const std::optional<std::string_view>& query,
              const std::optional<std::string_view>& fragment) {
      std::string result;
      if (scheme) {
        result += *scheme;
        result += ':';
      }
      if (authority) {
        result += "//";
        result += *authority;
      }
      result += path;
      if (query) {
        result += '?';
        result += *query;
      }
      if (fragment) {
        result += '#';
        result += *fragment;
      }
      return result;
    }

  } // namespace

  bool
  is_absolute_iri(std::string_view ref) {
    return scheme_length(ref) > 0;
  }

  std::string
  resolve_iri(std::string_view base, std::string_view ref) {
    auto r = split(ref);
    if (r.scheme) {
      return recompose(r.scheme, r.authority, remove_dot_segments(r.path),
                       r.query, r.fragment);
    }
    if (base.empty()) return std::string(ref);

    auto b = split(base);
    const auto& scheme = b.scheme;

    if (r.authority)
      return recompose(scheme, r.authority, remove_dot_segments(r.path),
                       r.query, r.fragment);

    if (r.path.empty()) {
      return recompose(scheme, b.authority, std::string(b.path),
                       r.query ? r.query : b.query, r.fragment);
    }

    std::string path = r.path.starts_with("/")
                           ? remove_dot_segments(r.path)
                           : remove_dot_segments(merge(b, r.path));
    return recompose(scheme, b.authority, path, r.query, r.fragment);
  }

} // namespace rdfdec
