#pragma once

#include <redlog.hpp>

namespace unitcovtool::cli {

// -v count, or UNITCOV_VERBOSE: info, verbose, trace, debug, pedantic
inline redlog::level level_from_verbosity(int count) {
  switch (count) {
  case 1:
    return redlog::level::verbose;
  case 2:
    return redlog::level::trace;
  case 3:
    return redlog::level::debug;
  default:
    return count > 3 ? redlog::level::pedantic : redlog::level::info;
  }
}

inline void apply_verbosity(int count) { redlog::set_level(level_from_verbosity(count)); }

} // namespace unitcovtool::cli
