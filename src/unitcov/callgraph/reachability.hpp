#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "unitcov/callgraph/call_graph.hpp"

namespace unitcov::callgraph {

/**
 * @brief (anchor, target) pairs whose failed node lookups count as "not reachable"
 *
 * Every other lookup failure is fatal, so each entry here is a gap in call graph
 * extraction that has been looked at and accepted.
 */
class lookup_exception_table {
public:
  using target_set = std::set<std::string, std::less<>>;
  using entry_map = std::map<std::string, target_set, std::less<>>;

  lookup_exception_table() = default;

  // the pairs known from the pacemaker tree
  static lookup_exception_table defaults();

  void add(const std::string& anchor, const std::string& target);
  bool contains(std::string_view anchor, std::string_view target) const;
  size_t size() const noexcept;

  const entry_map& entries() const noexcept { return entries_; }

private:
  entry_map entries_;
};

// "anchor:target" -> pair, nullopt if either side is empty or the colon is missing
std::optional<std::pair<std::string, std::string>> parse_lookup_exception(std::string_view text);

class reachability_oracle {
public:
  explicit reachability_oracle(lookup_exception_table exceptions = lookup_exception_table::defaults())
      : exceptions_(std::move(exceptions)) {}

  /**
   * @brief Whether any anchor reaches target through the graph
   *
   * An anchor equal to the target always reaches it. When an anchor or the target is not a
   * node, the pair is looked up in the exception table: listed pairs are skipped, others
   * throw unitcov::error(node_not_found).
   */
  bool is_reachable(const call_graph& graph, const std::vector<std::string>& anchors, std::string_view target) const;

  const lookup_exception_table& exceptions() const noexcept { return exceptions_; }

private:
  lookup_exception_table exceptions_;
};

} // namespace unitcov::callgraph
