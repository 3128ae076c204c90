#include <filesystem>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "cli.hpp"
#include "commands/mangle.hpp"
#include "unitcov/unitcov_config.hpp"

namespace {
auto log_main = redlog::get_logger("unitcovtool");
} // namespace

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "unitcovtool - keep only unit test coverage in an lcov tracefile",
      "rewritten tracefile is written to stdout. settings can also come from UNITCOV_* environment variables."
  );
  parser.helpParams.showTerminator = false;

  args::HelpFlag help_flag(parser, "help", "help", {'h', "help"});
  args::CounterFlag verbosity_flag(parser, "verbosity", "verbosity level", {'v'});
  args::ValueFlag<std::string> source_root_flag(
      parser, "dir", "directory holding the sources, tests and call graphs (default: .)", {"source-root"}
  );
  args::ValueFlag<std::string> lib_dir_flag(
      parser, "dir", "directory below the source root scanned for static functions (default: lib)", {"lib-dir"}
  );
  args::ValueFlagList<std::string> tested_flag(
      parser, "name", "treat function as unit tested (repeatable)", {"tested"}
  );
  args::ValueFlagList<std::string> allow_missing_flag(
      parser, "anchor:target", "accept a failed call graph lookup for this pair (repeatable)", {"allow-missing"}
  );
  args::Flag summary_flag(parser, "summary", "log a summary of attribution decisions", {"summary"});
  args::PositionalList<std::string> tracefile_args(parser, "tracefile", "lcov tracefile (.info)");

  try {
    parser.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  auto config = unitcov::unitcov_config::from_environment();
  if (verbosity_flag) {
    config.verbose = args::get(verbosity_flag);
  }
  unitcovtool::cli::apply_verbosity(config.verbose);

  // exactly one existing tracefile, anything else only prints usage
  const auto& tracefiles = args::get(tracefile_args);
  std::error_code ec;
  if (tracefiles.size() != 1 || !std::filesystem::is_regular_file(tracefiles.front(), ec)) {
    std::cout << parser;
    return 0;
  }
  const std::string& tracefile = tracefiles.front();

  if (source_root_flag) {
    config.source_root = args::get(source_root_flag);
  }
  if (lib_dir_flag) {
    config.lib_dir = args::get(lib_dir_flag);
  }
  for (const auto& name : args::get(tested_flag)) {
    config.extra_tested.push_back(name);
  }
  for (const auto& pair : args::get(allow_missing_flag)) {
    config.allow_missing.push_back(pair);
  }
  if (summary_flag) {
    config.summary = true;
  }

  log_main.dbg("starting", redlog::field("tracefile", tracefile));
  return unitcovtool::commands::mangle(config, tracefile);
}
