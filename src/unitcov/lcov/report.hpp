#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "unitcov/lcov/record.hpp"

namespace unitcov::lcov {

using record_callback = std::function<void(coverage_record record)>;

/**
 * @brief Splits a tracefile into records, invoking callback once per end_of_record marker
 *
 * Lines are trimmed; the marker itself is not part of the record. Lines after the last
 * marker form an unterminated record and are dropped.
 *
 * @return number of records delivered
 */
size_t for_each_record(std::istream& input, const record_callback& callback);

std::vector<coverage_record> parse_report(std::istream& input);

// reads a whole tracefile from disk, throws unitcov::error(io_error) if it cannot be opened
std::vector<coverage_record> read_report(const std::string& path);

// record lines followed by end_of_record, newline terminated
std::string render_record(const coverage_record& record);
void write_record(std::ostream& output, const coverage_record& record);

} // namespace unitcov::lcov
