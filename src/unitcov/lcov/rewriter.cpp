#include "rewriter.hpp"

#include <string>
#include <vector>

#include <redlog.hpp>

#include "unitcov/error.hpp"

namespace unitcov::lcov {

coverage_record erase_function(const coverage_record& record, const function_span& span) {
  auto log = redlog::get_logger("unitcov.rewriter");

  // first pass: measure what the erase removes, aggregates may precede the detail lines
  bool function_hit = false;
  int64_t executed_lines = 0;
  for (const auto& line : record.lines()) {
    switch (classify(line)) {
    case line_kind::function_data:
      if (function_data_name(line) == span.name && parse_function_data(line).count != 0) {
        function_hit = true;
      }
      break;
    case line_kind::line_data:
      if (span.contains(line_data_number(line)) && parse_line_data(line).count != 0) {
        ++executed_lines;
      }
      break;
    default:
      break;
    }
  }

  std::vector<std::string> rewritten;
  rewritten.reserve(record.size());

  for (const auto& line : record.lines()) {
    switch (classify(line)) {
    case line_kind::function_data: {
      if (function_data_name(line) != span.name) {
        break;
      }
      auto data = parse_function_data(line);
      if (data.count != 0) {
        data.count = 0;
        rewritten.push_back(format_function_data(data));
        continue;
      }
      break;
    }
    case line_kind::line_data: {
      if (!span.contains(line_data_number(line))) {
        break;
      }
      auto data = parse_line_data(line);
      if (data.count != 0) {
        data.count = 0;
        rewritten.push_back(format_line_data(data));
        continue;
      }
      break;
    }
    case line_kind::functions_hit:
      if (function_hit) {
        int64_t value = parse_aggregate(line) - 1;
        UNITCOV_ENSURE(value >= 0, "FNH below zero after erasing " + span.name);
        rewritten.push_back(format_aggregate(tags::functions_hit, value));
        continue;
      }
      break;
    case line_kind::lines_hit:
      if (executed_lines != 0) {
        int64_t value = parse_aggregate(line) - executed_lines;
        UNITCOV_ENSURE(value >= 0, "LH below zero after erasing " + span.name);
        rewritten.push_back(format_aggregate(tags::lines_hit, value));
        continue;
      }
      break;
    default:
      break;
    }
    rewritten.push_back(line);
  }

  log.trc(
      "erased function", redlog::field("function", span.name), redlog::field("was_hit", function_hit),
      redlog::field("lines", executed_lines)
  );

  return coverage_record(std::move(rewritten));
}

} // namespace unitcov::lcov
