#pragma once

#include <string>
#include <vector>

#include "unitcov/attribution/engine.hpp"
#include "unitcov/callgraph/reachability.hpp"

namespace unitcov {

struct unitcov_config {
  std::string source_root = ".";
  std::string lib_dir = "lib";
  std::vector<std::string> extra_tested;
  // "anchor:target" pairs added to the lookup exception table
  std::vector<std::string> allow_missing;
  attribution::naming_convention naming{};
  int verbose = 0;
  bool summary = false;

  // reads UNITCOV_* variables; unset variables keep the defaults above
  static unitcov_config from_environment();

  // the default exception table plus allow_missing, throws unitcov::error(invalid_config) on a bad entry
  callgraph::lookup_exception_table lookup_exceptions() const;
};

} // namespace unitcov
