#pragma once

#include <rdfdec/term.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace rdfdec {

  // Blank node identifiers for one decoding session. Labels from the input
  // keep their spelling unless a generated node already took it, and
  // generated nodes never reuse an identifier in use.
  class blank_scope {
  public:
    // The node for a label written in the input; the same label always
    // yields the same node.
    blank_node
    labelled(const std::string& label);

    // A node distinct from every other node of the session.
    blank_node
    fresh();

    std::size_t
    size() const {
      return used_.size();
    }

  private:
    std::unordered_map<std::string, std::string> labels_;
    std::unordered_set<std::string> used_;
    std::size_t counter_ = 0;
  };

} // namespace rdfdec
