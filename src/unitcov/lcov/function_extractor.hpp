#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "unitcov/lcov/record.hpp"

namespace unitcov::lcov {

// line range of one function, inferred from declaration order; no end means "to end of file".
// the end is signed: a function followed by one at line 0 ends at -1 and covers no line
struct function_span {
  std::string name;
  uint32_t start_line = 0;
  std::optional<int64_t> end_line;

  bool contains(uint32_t line) const noexcept {
    return line >= start_line && (!end_line || static_cast<int64_t>(line) <= *end_line);
  }

  bool operator==(const function_span& other) const = default;
};

/**
 * @brief One span per FN line, in declaration order
 *
 * Each span ends on the line before the next function starts; the last one is left open.
 * Out-of-order or overlapping declarations are taken as they come.
 */
std::vector<function_span> extract_functions(const coverage_record& record);

// true when the function has an FNDA line with a nonzero count
bool function_executed(const coverage_record& record, std::string_view name);

} // namespace unitcov::lcov
