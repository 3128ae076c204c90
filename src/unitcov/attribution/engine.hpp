#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "unitcov/callgraph/call_graph.hpp"
#include "unitcov/callgraph/reachability.hpp"
#include "unitcov/lcov/record.hpp"
#include "unitcov/types.hpp"

namespace unitcov::attribution {

// a private name whose public twin has a unit test counts as tested, e.g. pcmk__foo -> pcmk_foo
struct naming_convention {
  std::string private_prefix = "pcmk__";
  std::string public_prefix = "pcmk_";

  std::optional<std::string> public_counterpart(std::string_view name) const;
};

// run-wide inputs, computed once and shared by every record
struct attribution_inputs {
  name_set tested;
  name_set restricted;
  naming_convention naming;
};

enum class decision {
  not_executed,
  kept_proxy,
  kept_reachable,
  kept_tested,
  erased_unreachable,
  erased_untested
};

constexpr size_t decision_count = 6;

const char* decision_name(decision value) noexcept;

inline bool is_erasure(decision value) noexcept {
  return value == decision::erased_unreachable || value == decision::erased_untested;
}

struct function_decision {
  std::string name;
  decision outcome = decision::not_executed;
};

struct record_result {
  lcov::coverage_record record;
  std::vector<function_decision> decisions;
  bool had_call_graph = false;
};

/**
 * @brief Decides, function by function, whether a record keeps its coverage
 *
 * Executed functions keep their coverage when they have a unit test, when they are the
 * private twin of a tested public function, or, for file-local functions, when a tested
 * function of the same file reaches them in the call graph. Everything else executed is
 * erased. Records without a call graph are returned unchanged.
 */
class attribution_engine {
public:
  attribution_engine(attribution_inputs inputs, callgraph::reachability_oracle oracle);

  record_result process(const lcov::coverage_record& record, const callgraph::call_graph* graph) const;

private:
  attribution_inputs inputs_;
  callgraph::reachability_oracle oracle_;
};

struct attribution_summary {
  size_t records = 0;
  size_t records_without_call_graph = 0;
  std::array<size_t, decision_count> decisions{};

  void add(const record_result& result);
  size_t count(decision value) const noexcept { return decisions[static_cast<size_t>(value)]; }
  size_t erased() const noexcept;
};

} // namespace unitcov::attribution
