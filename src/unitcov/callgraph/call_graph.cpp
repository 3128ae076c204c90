#include "call_graph.hpp"

#include <deque>

#include "unitcov/error.hpp"

namespace unitcov::callgraph {

void call_graph::add_node(const std::string& name) { nodes_.try_emplace(name); }

void call_graph::add_edge(const std::string& caller, const std::string& callee) {
  add_node(callee);
  if (nodes_[caller].insert(callee).second) {
    ++edge_count_;
  }
}

const std::unordered_set<std::string>* call_graph::callees(std::string_view name) const {
  auto it = nodes_.find(std::string(name));
  return it == nodes_.end() ? nullptr : &it->second;
}

bool call_graph::has_node(std::string_view name) const { return callees(name) != nullptr; }

bool call_graph::has_edge(std::string_view caller, std::string_view callee) const {
  const auto* out = callees(caller);
  return out && out->count(std::string(callee)) != 0;
}

bool call_graph::has_path(std::string_view source, std::string_view target) const {
  if (!has_node(source)) {
    throw error(error_code::node_not_found, "source " + std::string(source) + " is not in the call graph");
  }
  if (!has_node(target)) {
    throw error(error_code::node_not_found, "target " + std::string(target) + " is not in the call graph");
  }

  if (source == target) {
    return true;
  }

  std::unordered_set<std::string> visited{std::string(source)};
  std::deque<std::string> pending{std::string(source)};

  while (!pending.empty()) {
    std::string current = std::move(pending.front());
    pending.pop_front();

    for (const auto& next : *callees(current)) {
      if (next == target) {
        return true;
      }
      if (visited.insert(next).second) {
        pending.push_back(next);
      }
    }
  }

  return false;
}

} // namespace unitcov::callgraph
