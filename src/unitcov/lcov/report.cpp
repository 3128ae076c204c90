#include "report.hpp"

#include <fstream>
#include <istream>
#include <ostream>

#include <redlog.hpp>

#include "unitcov/error.hpp"
#include "unitcov/util/string_utils.hpp"

namespace unitcov::lcov {

size_t for_each_record(std::istream& input, const record_callback& callback) {
  auto log = redlog::get_logger("unitcov.parser");

  std::vector<std::string> current;
  size_t delivered = 0;
  std::string line;

  while (std::getline(input, line)) {
    std::string trimmed = util::trim_copy(line);
    if (trimmed == tags::end_of_record) {
      callback(coverage_record(std::move(current)));
      current = {};
      ++delivered;
      continue;
    }
    current.push_back(std::move(trimmed));
  }

  if (input.bad()) {
    throw error(error_code::io_error, "error reading tracefile");
  }

  if (!current.empty()) {
    log.dbg("dropping unterminated trailing record", redlog::field("lines", current.size()));
  }

  log.trc("split tracefile", redlog::field("records", delivered));
  return delivered;
}

std::vector<coverage_record> parse_report(std::istream& input) {
  std::vector<coverage_record> records;
  for_each_record(input, [&records](coverage_record record) { records.push_back(std::move(record)); });
  return records;
}

std::vector<coverage_record> read_report(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw error(error_code::io_error, "cannot open tracefile: " + path);
  }

  auto log = redlog::get_logger("unitcov.parser");
  log.dbg("reading tracefile", redlog::field("path", path));
  return parse_report(file);
}

std::string render_record(const coverage_record& record) {
  std::string out;
  for (const auto& line : record.lines()) {
    out += line;
    out += '\n';
  }
  out += tags::end_of_record;
  out += '\n';
  return out;
}

void write_record(std::ostream& output, const coverage_record& record) {
  output << render_record(record);
  output.flush();
  if (!output) {
    throw error(error_code::io_error, "error writing tracefile record");
  }
}

} // namespace unitcov::lcov
