#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unitcov::lcov {

namespace tags {
constexpr std::string_view source_file = "SF";
constexpr std::string_view function = "FN";
constexpr std::string_view function_data = "FNDA";
constexpr std::string_view functions_hit = "FNH";
constexpr std::string_view line_data = "DA";
constexpr std::string_view lines_hit = "LH";
constexpr std::string_view end_of_record = "end_of_record";
} // namespace tags

// kinds of tracefile lines the attribution code cares about; everything else is other
enum class line_kind {
  source_file,
  function,
  function_data,
  functions_hit,
  line_data,
  lines_hit,
  other
};

line_kind classify(std::string_view line);

// FN:<start>,<name> or FN:<start>,<end>,<name>
struct function_line {
  uint32_t start_line = 0;
  std::optional<uint32_t> end_line;
  std::string name;
};

// FNDA:<count>,<name>
struct function_data_line {
  int64_t count = 0;
  std::string name;
};

// DA:<line>,<count>[,<checksum>]
struct line_data_line {
  uint32_t line = 0;
  int64_t count = 0;
  std::optional<std::string> checksum;
};

// the parse_* functions throw unitcov::error(malformed_line) when the fields cannot be split
function_line parse_function(std::string_view line);
function_data_line parse_function_data(std::string_view line);
line_data_line parse_line_data(std::string_view line);
int64_t parse_aggregate(std::string_view line);

// key fields only; the count is left unread so an oversized count elsewhere in a record does not matter
std::string_view function_data_name(std::string_view line);
uint32_t line_data_number(std::string_view line);

std::string format_function_data(const function_data_line& data);
std::string format_line_data(const line_data_line& data);
std::string format_aggregate(std::string_view tag, int64_t value);

/**
 * @brief Coverage data of one source file, as the ordered raw lines between two end_of_record markers
 *
 * Records are values: rewriting produces a new record and leaves the input untouched.
 */
class coverage_record {
public:
  coverage_record() = default;
  explicit coverage_record(std::vector<std::string> lines) : lines_(std::move(lines)) {}

  const std::vector<std::string>& lines() const noexcept { return lines_; }
  size_t size() const noexcept { return lines_.size(); }
  bool empty() const noexcept { return lines_.empty(); }

  // path from the first SF line
  std::optional<std::string> source_file() const;

  // execution count from the FNDA line of the named function
  std::optional<int64_t> function_count(std::string_view name) const;

  bool operator==(const coverage_record& other) const = default;

private:
  std::vector<std::string> lines_;
};

} // namespace unitcov::lcov
