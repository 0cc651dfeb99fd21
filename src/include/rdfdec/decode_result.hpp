#pragma once

#include <rdfdec/errors.hpp>

#include <utility>
#include <variant>
#include <vector>

namespace rdfdec {

  // Terminal success signal: the source holds no more statements.
  struct end_of_stream {
    bool
    operator==(const end_of_stream&) const = default;
  };

  // Outcome of one decode() call: exactly one of an item, end of stream, or
  // an input fault. Accessors throw std::bad_variant_access on the wrong
  // alternative.
  template <typename T>
  class decode_result {
    std::variant<T, end_of_stream, fault> state_;

  public:
    decode_result(T item) : state_(std::move(item)) {}
    decode_result(end_of_stream eos) : state_(eos) {}
    decode_result(fault f) : state_(std::move(f)) {}

    bool
    has_value() const {
      return std::holds_alternative<T>(state_);
    }

    bool
    at_end() const {
      return std::holds_alternative<end_of_stream>(state_);
    }

    bool
    failed() const {
      return std::holds_alternative<fault>(state_);
    }

    explicit
    operator bool() const {
      return has_value();
    }

    const T&
    value() const {
      return std::get<T>(state_);
    }

    T&
    value() {
      return std::get<T>(state_);
    }

    const fault&
    error() const {
      return std::get<fault>(state_);
    }
  };

  // Outcome of decode_all(): every item in arrival order, or the first fault
  // with nothing decoded before it.
  template <typename T>
  class decode_all_result {
    std::variant<std::vector<T>, fault> state_;

  public:
    decode_all_result(std::vector<T> items) : state_(std::move(items)) {}
    decode_all_result(fault f) : state_(std::move(f)) {}

    bool
    has_value() const {
      return std::holds_alternative<std::vector<T>>(state_);
    }

    bool
    failed() const {
      return std::holds_alternative<fault>(state_);
    }

    explicit
    operator bool() const {
      return has_value();
    }

    const std::vector<T>&
    value() const {
      return std::get<std::vector<T>>(state_);
    }

    std::vector<T>&
    value() {
      return std::get<std::vector<T>>(state_);
    }

    const fault&
    error() const {
      return std::get<fault>(state_);
    }
  };

} // namespace rdfdec
