#pragma once

#include <string>

#include "unitcov/unitcov_config.hpp"

namespace unitcovtool::commands {

/**
 * mangle command - strips coverage not earned by unit tests from an lcov tracefile
 *
 * @param config run configuration (source root, lib dir, extra tested names, exceptions)
 * @param tracefile path to the .info file, the rewritten records go to stdout
 * @return exit code (0 for success, 1 for failure)
 */
int mangle(const unitcov::unitcov_config& config, const std::string& tracefile);

} // namespace unitcovtool::commands
