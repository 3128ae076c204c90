#include "engine.hpp"

#include <redlog.hpp>

#include "unitcov/lcov/function_extractor.hpp"
#include "unitcov/lcov/rewriter.hpp"

namespace unitcov::attribution {

std::optional<std::string> naming_convention::public_counterpart(std::string_view name) const {
  if (private_prefix.empty() || name.substr(0, private_prefix.size()) != private_prefix) {
    return std::nullopt;
  }
  return public_prefix + std::string(name.substr(private_prefix.size()));
}

const char* decision_name(decision value) noexcept {
  switch (value) {
  case decision::not_executed:
    return "not_executed";
  case decision::kept_proxy:
    return "kept_proxy";
  case decision::kept_reachable:
    return "kept_reachable";
  case decision::kept_tested:
    return "kept_tested";
  case decision::erased_unreachable:
    return "erased_unreachable";
  case decision::erased_untested:
    return "erased_untested";
  }
  return "unknown";
}

attribution_engine::attribution_engine(attribution_inputs inputs, callgraph::reachability_oracle oracle)
    : inputs_(std::move(inputs)), oracle_(std::move(oracle)) {}

record_result attribution_engine::process(const lcov::coverage_record& record, const callgraph::call_graph* graph)
    const {
  auto log = redlog::get_logger("unitcov.engine");

  record_result result;
  result.record = record;
  result.had_call_graph = graph != nullptr;

  std::string source = record.source_file().value_or("<unknown>");
  if (!graph) {
    log.dbg("no call graph, keeping record as is", redlog::field("source", source));
    return result;
  }

  auto spans = lcov::extract_functions(record);

  std::vector<std::string> anchors;
  for (const auto& span : spans) {
    if (inputs_.tested.count(span.name) != 0 && inputs_.restricted.count(span.name) == 0) {
      anchors.push_back(span.name);
    }
  }

  for (const auto& span : spans) {
    decision outcome;

    if (!lcov::function_executed(result.record, span.name)) {
      outcome = decision::not_executed;
    } else if (auto counterpart = inputs_.naming.public_counterpart(span.name);
               counterpart && inputs_.tested.count(*counterpart) != 0) {
      // the tested public twin vouches for this function and for the static helpers it calls
      anchors.push_back(span.name);
      outcome = decision::kept_proxy;
    } else if (inputs_.restricted.count(span.name) != 0) {
      outcome = oracle_.is_reachable(*graph, anchors, span.name) ? decision::kept_reachable
                                                                  : decision::erased_unreachable;
    } else {
      outcome = inputs_.tested.count(span.name) != 0 ? decision::kept_tested : decision::erased_untested;
    }

    if (is_erasure(outcome)) {
      result.record = lcov::erase_function(result.record, span);
      log.vrb(
          "erased coverage", redlog::field("source", source), redlog::field("function", span.name),
          redlog::field("reason", decision_name(outcome))
      );
    } else {
      log.trc(
          "kept coverage", redlog::field("source", source), redlog::field("function", span.name),
          redlog::field("reason", decision_name(outcome))
      );
    }

    result.decisions.push_back(function_decision{span.name, outcome});
  }

  return result;
}

void attribution_summary::add(const record_result& result) {
  ++records;
  if (!result.had_call_graph) {
    ++records_without_call_graph;
  }
  for (const auto& entry : result.decisions) {
    ++decisions[static_cast<size_t>(entry.outcome)];
  }
}

size_t attribution_summary::erased() const noexcept {
  return count(decision::erased_unreachable) + count(decision::erased_untested);
}

} // namespace unitcov::attribution
