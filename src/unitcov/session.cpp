#include "session.hpp"

#include <filesystem>
#include <ostream>

#include <redlog.hpp>

#include "unitcov/callgraph/ci_parser.hpp"
#include "unitcov/discovery/restricted_functions.hpp"
#include "unitcov/discovery/test_anchors.hpp"
#include "unitcov/error.hpp"
#include "unitcov/lcov/report.hpp"

namespace unitcov {

namespace {

std::filesystem::path absolute_root(const std::string& root) {
  return std::filesystem::absolute(root).lexically_normal();
}

} // namespace

session::session(unitcov_config config) : config_(std::move(config)) {}

void session::initialize() {
  if (initialized_) {
    return;
  }

  auto log = redlog::get_logger("unitcov.session");

  std::filesystem::path root = absolute_root(config_.source_root);
  log.dbg("initializing", redlog::field("source_root", root.string()), redlog::field("lib_dir", config_.lib_dir));

  inputs_.tested = discovery::discover_tested_functions(root);
  inputs_.tested.insert(config_.extra_tested.begin(), config_.extra_tested.end());
  inputs_.restricted = discovery::discover_restricted_functions(root / config_.lib_dir);
  inputs_.naming = config_.naming;

  locator_ = discovery::callgraph_locator::scan(root);

  auto exceptions = config_.lookup_exceptions();
  log.dbg("lookup exceptions", redlog::field("pairs", exceptions.size()));

  engine_ = std::make_unique<attribution::attribution_engine>(
      inputs_, callgraph::reachability_oracle(std::move(exceptions))
  );
  initialized_ = true;

  log.vrb(
      "session ready", redlog::field("tested", inputs_.tested.size()),
      redlog::field("static", inputs_.restricted.size()), redlog::field("call_graphs", locator_.callgraphs().size())
  );
}

attribution::record_result session::process_record(const lcov::coverage_record& record) const {
  if (!engine_) {
    throw error(error_code::invalid_config, "session used before initialize()");
  }

  auto log = redlog::get_logger("unitcov.session");

  auto source = record.source_file();
  if (!source) {
    log.warn("record without SF line, keeping it as is", redlog::field("lines", record.size()));
    return engine_->process(record, nullptr);
  }

  std::filesystem::path root = absolute_root(config_.source_root);
  std::string relative = discovery::relative_to_root(*source, root.generic_string());

  auto artifact = locator_.find(relative);
  if (!artifact) {
    log.dbg("no call graph for source", redlog::field("source", relative));
    return engine_->process(record, nullptr);
  }

  log.trc("using call graph", redlog::field("source", relative), redlog::field("call_graph", *artifact));
  auto graph = callgraph::read_callgraph((root / *artifact).string());
  return engine_->process(record, &graph);
}

attribution::attribution_summary session::run(const std::string& tracefile, std::ostream& output) {
  initialize();

  auto log = redlog::get_logger("unitcov.session");

  auto records = lcov::read_report(tracefile);
  log.vrb("read tracefile", redlog::field("path", tracefile), redlog::field("records", records.size()));

  attribution::attribution_summary summary;
  for (const auto& record : records) {
    auto result = process_record(record);
    lcov::write_record(output, result.record);
    summary.add(result);
  }

  return summary;
}

} // namespace unitcov
