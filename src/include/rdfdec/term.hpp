#pragma once

#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace rdfdec {

  class iri {
    std::string value_;

  public:
    iri() = default;

    explicit iri(std::string value) : value_(std::move(value)) {}

    const std::string&
    value() const {
      return value_;
    }

    auto
    operator<=>(const iri&) const = default;

    bool
    operator==(const iri&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const iri& i) {
      return os << '<' << i.value_ << '>';
    }
  };

  // A blank node identifier, scoped to one decoding session. The default
  // graph sentinel is a blank node carrying an internal tag, so it never
  // compares equal to a blank node read from input.
  class blank_node {
    std::string id_;
    bool default_graph_ = false;

  public:
    blank_node() = default;

    explicit blank_node(std::string id) : id_(std::move(id)) {}

    static blank_node
    default_graph() {
      blank_node b("defaultGraph");
      b.default_graph_ = true;
      return b;
    }

    const std::string&
    id() const {
      return id_;
    }

    bool
    is_default_graph() const {
      return default_graph_;
    }

    auto
    operator<=>(const blank_node&) const = default;

    bool
    operator==(const blank_node&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const blank_node& b) {
      if (b.default_graph_) return os << "(default graph)";
      return os << "_:" << b.id_;
    }
  };

  // A lexical form with at most one of a datatype or a language tag.
  class literal {
    std::string lexical_;
    std::optional<iri> datatype_;
    std::string language_;

  public:
    literal() = default;

    explicit literal(std::string lexical) : lexical_(std::move(lexical)) {}

    literal(std::string lexical, iri datatype)
        : lexical_(std::move(lexical)), datatype_(std::move(datatype)) {}

    // Throws std::invalid_argument for an empty language tag.
    literal(std::string lexical, std::string language);

    const std::string&
    lexical() const {
      return lexical_;
    }

    const std::optional<iri>&
    datatype() const {
      return datatype_;
    }

    const std::string&
    language() const {
      return language_;
    }

    bool
    has_language() const {
      return !language_.empty();
    }

    auto
    operator<=>(const literal&) const = default;

    bool
    operator==(const literal&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const literal& l);
  };

  using term = std::variant<iri, blank_node, literal>;

  // Terms allowed in subject and graph position.
  using resource = std::variant<iri, blank_node>;

  term
  to_term(const resource& r);

  std::string
  to_string(const term& t);

  std::string
  to_string(const resource& r);

  struct triple {
    resource subject;
    iri predicate;
    term object;

    bool
    operator==(const triple&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const triple& t);
  };

  struct quad {
    resource subject;
    iri predicate;
    term object;
    resource context;

    triple
    as_triple() const {
      return triple{subject, predicate, object};
    }

    bool
    operator==(const quad&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const quad& q);
  };

  namespace vocab {

    inline const std::string rdf_ns =
        "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    inline const std::string xsd_ns = "http://www.w3.org/2001/XMLSchema#";

    inline const iri rdf_type{rdf_ns + "type"};
    inline const iri rdf_first{rdf_ns + "first"};
    inline const iri rdf_rest{rdf_ns + "rest"};
    inline const iri rdf_nil{rdf_ns + "nil"};
    inline const iri rdf_xml_literal{rdf_ns + "XMLLiteral"};
    inline const iri rdf_lang_string{rdf_ns + "langString"};
    inline const iri rdf_statement{rdf_ns + "Statement"};
    inline const iri rdf_subject{rdf_ns + "subject"};
    inline const iri rdf_predicate{rdf_ns + "predicate"};
    inline const iri rdf_object{rdf_ns + "object"};

    inline const iri xsd_string{xsd_ns + "string"};
    inline const iri xsd_integer{xsd_ns + "integer"};
    inline const iri xsd_decimal{xsd_ns + "decimal"};
    inline const iri xsd_double{xsd_ns + "double"};
    inline const iri xsd_boolean{xsd_ns + "boolean"};

  } // namespace vocab

} // namespace rdfdec

template <>
struct std::hash<rdfdec::iri> {
  std::size_t
  operator()(const rdfdec::iri& i) const noexcept {
    return std::hash<std::string>{}(i.value());
  }
};

template <>
struct std::hash<rdfdec::blank_node> {
  std::size_t
  operator()(const rdfdec::blank_node& b) const noexcept {
    std::size_t h = std::hash<std::string>{}(b.id());
    return b.is_default_graph() ? ~h : h;
  }
};
