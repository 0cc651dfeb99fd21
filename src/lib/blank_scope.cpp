#include <rdfdec/blank_scope.hpp>

namespace rdfdec {

  blank_node
  blank_scope::labelled(const std::string& label) {
    if (auto it = labels_.find(label); it != labels_.end())
      return blank_node(it->second);

    if (used_.insert(label).second) {
      labels_.emplace(label, label);
      return blank_node(label);
    }
    auto node = fresh();
    labels_.emplace(label, node.id());
    return node;
  }

  blank_node
  blank_scope::fresh() {
    std::string id;
    do {
      id = "b" + std::to_string(++counter_);
    } while (!used_.insert(id).second);
    return blank_node(std::move(id));
  }

} // namespace rdfdec
