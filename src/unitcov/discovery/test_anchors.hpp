#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "unitcov/types.hpp"

namespace unitcov::discovery {

// suffix of a unit test source named after the function it tests: foo_test.c tests foo()
constexpr std::string_view test_file_suffix = "_test.c";

// functions whose tests live in a file named after something else
const std::vector<std::string>& known_tested_functions();

// foo_test.c -> foo, empty when the file name does not carry the suffix
std::string tested_function_from_file_name(std::string_view file_name);

/**
 * @brief Names of all functions with a unit test under root
 *
 * Every *_test.c below root contributes its stem, then known_tested_functions() is merged in.
 */
name_set discover_tested_functions(const std::filesystem::path& root);

} // namespace unitcov::discovery
