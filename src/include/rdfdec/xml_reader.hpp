#pragma once

#include <rdfdec/qname.hpp>

#include <cstddef>
#include <string_view>

namespace rdfdec {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull interface over XML parse events. read() throws parse_error for
  // malformed XML; accessors refer to the event read last.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    // Prefix the element was written with, empty for the default namespace.
    virtual std::string_view
    prefix() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_prefix(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(const qname& name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    virtual std::size_t
    line() const = 0;

    virtual std::size_t
    column() const = 0;
  };

} // namespace rdfdec
