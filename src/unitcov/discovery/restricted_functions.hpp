#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "unitcov/types.hpp"

namespace unitcov::discovery {

/**
 * @brief Guesses the function name declared on one line of C source
 *
 * The line must contain '(' and no '='. The name is the last space separated word before
 * the first '(', with anything that cannot appear in a C identifier removed.
 */
std::optional<std::string> function_name_from_declaration(std::string_view line);

// every line starting with "static" and the line after it are run through function_name_from_declaration
void collect_restricted_functions(std::istream& source, name_set& out);

/**
 * @brief File-local functions declared in the .c and .h files below lib_dir
 *
 * A textual approximation: anything that looks like a static function declaration counts.
 * A missing directory gives an empty set.
 */
name_set discover_restricted_functions(const std::filesystem::path& lib_dir);

} // namespace unitcov::discovery
