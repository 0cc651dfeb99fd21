#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace rdfdec {

  inline constexpr std::string_view xml_namespace =
      "http://www.w3.org/XML/1998/namespace";

  // An expanded XML element or attribute name. RDF/XML names a property or
  // class by the concatenation of namespace and local name.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    bool
    qualified() const {
      return !namespace_uri_.empty();
    }

    bool
    in_namespace(std::string_view ns) const {
      return namespace_uri_ == ns;
    }

    bool
    is(std::string_view ns, std::string_view local) const {
      return namespace_uri_ == ns && local_name_ == local;
    }

    std::string
    concatenated() const {
      return namespace_uri_ + local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (!q.qualified()) return os << q.local_name_;
      return os << '{' << q.namespace_uri_ << '}' << q.local_name_;
    }
  };

} // namespace rdfdec

template <>
struct std::hash<rdfdec::qname> {
  std::size_t
  operator()(const rdfdec::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
