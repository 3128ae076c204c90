#include "mangle.hpp"

#include <filesystem>
#include <iostream>

#include <redlog.hpp>

#include "unitcov/attribution/engine.hpp"
#include "unitcov/error.hpp"
#include "unitcov/session.hpp"

namespace unitcovtool::commands {

namespace {

void log_summary(const unitcov::attribution::attribution_summary& summary, bool at_info) {
  auto log = redlog::get_logger("unitcovtool.mangle");

  using unitcov::attribution::decision;
  auto emit = [&](const char* message, auto... fields) {
    if (at_info) {
      log.info(message, fields...);
    } else {
      log.vrb(message, fields...);
    }
  };

  emit(
      "attribution summary", redlog::field("records", summary.records),
      redlog::field("without_call_graph", summary.records_without_call_graph),
      redlog::field("erased", summary.erased())
  );
  emit(
      "kept functions", redlog::field("tested", summary.count(decision::kept_tested)),
      redlog::field("proxy", summary.count(decision::kept_proxy)),
      redlog::field("reachable", summary.count(decision::kept_reachable))
  );
  emit(
      "erased functions", redlog::field("untested", summary.count(decision::erased_untested)),
      redlog::field("unreachable", summary.count(decision::erased_unreachable)),
      redlog::field("not_executed", summary.count(decision::not_executed))
  );
}

} // namespace

int mangle(const unitcov::unitcov_config& config, const std::string& tracefile) {
  auto log = redlog::get_logger("unitcovtool.mangle");

  log.dbg("mangling tracefile", redlog::field("path", tracefile), redlog::field("source_root", config.source_root));

  try {
    unitcov::session session(config);
    auto summary = session.run(tracefile, std::cout);
    log_summary(summary, config.summary);
    return 0;

  } catch (const unitcov::error& e) {
    log.err(
        "mangling failed", redlog::field("code", unitcov::error_code_name(e.code())), redlog::field("error", e.what())
    );
    return 1;
  } catch (const std::filesystem::filesystem_error& e) {
    log.err("file system error", redlog::field("path", e.path1().string()), redlog::field("error", e.what()));
    return 1;
  }
}

} // namespace unitcovtool::commands
