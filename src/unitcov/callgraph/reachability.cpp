#include "reachability.hpp"

#include <redlog.hpp>

#include "unitcov/error.hpp"

namespace unitcov::callgraph {

lookup_exception_table lookup_exception_table::defaults() {
  lookup_exception_table table;

  // TODO: find out why gcc records no node for these anchors in their call graphs
  for (const char* target :
       {"ends_with", "pcmk__str_hash", "pcmk__strcase_equal", "pcmk__strcase_hash", "copy_str_table_entry"}) {
    table.add("pcmk__starts_with", target);
  }
  table.add("pe__cmp_rsc_priority", "resource_node_score");

  return table;
}

void lookup_exception_table::add(const std::string& anchor, const std::string& target) {
  entries_[anchor].insert(target);
}

bool lookup_exception_table::contains(std::string_view anchor, std::string_view target) const {
  auto it = entries_.find(anchor);
  return it != entries_.end() && it->second.find(target) != it->second.end();
}

size_t lookup_exception_table::size() const noexcept {
  size_t total = 0;
  for (const auto& [anchor, targets] : entries_) {
    total += targets.size();
  }
  return total;
}

std::optional<std::pair<std::string, std::string>> parse_lookup_exception(std::string_view text) {
  size_t colon = text.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }

  std::string anchor(text.substr(0, colon));
  std::string target(text.substr(colon + 1));
  if (anchor.empty() || target.empty()) {
    return std::nullopt;
  }
  return std::make_pair(std::move(anchor), std::move(target));
}

bool reachability_oracle::is_reachable(
    const call_graph& graph, const std::vector<std::string>& anchors, std::string_view target
) const {
  auto log = redlog::get_logger("unitcov.reachability");

  for (const auto& anchor : anchors) {
    if (anchor == target) {
      return true;
    }

    if (!graph.has_node(anchor) || !graph.has_node(target)) {
      if (exceptions_.contains(anchor, target)) {
        log.ped("ignoring listed lookup failure", redlog::field("anchor", anchor), redlog::field("target", target));
        continue;
      }

      std::string missing = graph.has_node(anchor) ? std::string(target) : anchor;
      throw error(
          error_code::node_not_found, "call graph has no node for " + missing + " (anchor " + anchor + ", target " +
                                          std::string(target) + ")"
      );
    }

    if (graph.has_path(anchor, target)) {
      log.ped("target reachable", redlog::field("anchor", anchor), redlog::field("target", target));
      return true;
    }
  }

  return false;
}

} // namespace unitcov::callgraph
