#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace unitcov::callgraph {

/**
 * @brief Static calls between the functions of one translation unit
 *
 * A directed graph without parallel edges. Nodes appear when an edge names them or when
 * they are added explicitly; a function that takes part in no recorded call may be absent.
 */
class call_graph {
public:
  void add_node(const std::string& name);
  void add_edge(const std::string& caller, const std::string& callee);

  bool has_node(std::string_view name) const;
  bool has_edge(std::string_view caller, std::string_view callee) const;

  size_t node_count() const noexcept { return nodes_.size(); }
  size_t edge_count() const noexcept { return edge_count_; }

  /**
   * @brief Whether a directed path of length zero or more leads from source to target
   *
   * Throws unitcov::error(node_not_found) if either name is not a node.
   */
  bool has_path(std::string_view source, std::string_view target) const;

private:
  const std::unordered_set<std::string>* callees(std::string_view name) const;

  std::unordered_map<std::string, std::unordered_set<std::string>> nodes_;
  size_t edge_count_ = 0;
};

} // namespace unitcov::callgraph
