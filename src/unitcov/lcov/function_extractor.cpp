#include "function_extractor.hpp"

namespace unitcov::lcov {

std::vector<function_span> extract_functions(const coverage_record& record) {
  std::vector<function_span> spans;

  for (const auto& line : record.lines()) {
    if (classify(line) != line_kind::function) {
      continue;
    }
    auto fn = parse_function(line);
    spans.push_back(function_span{std::move(fn.name), fn.start_line, std::nullopt});
  }

  for (size_t i = 0; i + 1 < spans.size(); ++i) {
    spans[i].end_line = static_cast<int64_t>(spans[i + 1].start_line) - 1;
  }

  return spans;
}

bool function_executed(const coverage_record& record, std::string_view name) {
  auto count = record.function_count(name);
  return count && *count != 0;
}

} // namespace unitcov::lcov
