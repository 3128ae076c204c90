#include "record.hpp"

#include "unitcov/error.hpp"
#include "unitcov/util/string_utils.hpp"

namespace unitcov::lcov {

namespace {

std::string_view tag_of(std::string_view line) {
  size_t colon = line.find(':');
  if (colon == std::string_view::npos) {
    return std::string_view();
  }
  return line.substr(0, colon);
}

// value part of "<tag>:<value>", the caller has already classified the line
std::string_view value_of(std::string_view line, std::string_view tag) {
  return line.substr(tag.size() + 1);
}

[[noreturn]] void malformed(std::string_view line, const char* reason) {
  throw error(error_code::malformed_line, std::string(reason) + ": '" + std::string(line) + "'");
}

template <typename T> T number_field(std::string_view line, std::string_view field, const char* reason) {
  auto value = util::parse_number<T>(field);
  if (!value) {
    malformed(line, reason);
  }
  return *value;
}

} // namespace

line_kind classify(std::string_view line) {
  std::string_view tag = tag_of(line);
  if (tag == tags::source_file) {
    return line_kind::source_file;
  }
  if (tag == tags::function) {
    return line_kind::function;
  }
  if (tag == tags::function_data) {
    return line_kind::function_data;
  }
  if (tag == tags::functions_hit) {
    return line_kind::functions_hit;
  }
  if (tag == tags::line_data) {
    return line_kind::line_data;
  }
  if (tag == tags::lines_hit) {
    return line_kind::lines_hit;
  }
  return line_kind::other;
}

function_line parse_function(std::string_view line) {
  std::string_view value = value_of(line, tags::function);
  size_t comma = value.find(',');
  if (comma == std::string_view::npos) {
    malformed(line, "FN line without a comma");
  }

  function_line out;
  out.start_line = number_field<uint32_t>(line, value.substr(0, comma), "FN line with a non-numeric start line");

  std::string_view rest = value.substr(comma + 1);

  // lcov 2.x writes FN:<start>,<end>,<name>; a name never starts with a digit
  size_t second = rest.find(',');
  if (second != std::string_view::npos) {
    if (auto end = util::parse_number<uint32_t>(rest.substr(0, second))) {
      out.end_line = *end;
      rest = rest.substr(second + 1);
    }
  }

  if (rest.empty()) {
    malformed(line, "FN line without a function name");
  }
  out.name = std::string(rest);
  return out;
}

function_data_line parse_function_data(std::string_view line) {
  std::string_view value = value_of(line, tags::function_data);
  size_t comma = value.find(',');
  if (comma == std::string_view::npos) {
    malformed(line, "FNDA line without a comma");
  }

  function_data_line out;
  out.count = number_field<int64_t>(line, value.substr(0, comma), "FNDA line with a non-numeric count");
  out.name = std::string(value.substr(comma + 1));
  if (out.name.empty()) {
    malformed(line, "FNDA line without a function name");
  }
  return out;
}

line_data_line parse_line_data(std::string_view line) {
  std::string_view value = value_of(line, tags::line_data);
  size_t comma = value.find(',');
  if (comma == std::string_view::npos) {
    malformed(line, "DA line without a comma");
  }

  line_data_line out;
  out.line = number_field<uint32_t>(line, value.substr(0, comma), "DA line with a non-numeric line number");

  std::string_view rest = value.substr(comma + 1);
  size_t checksum = rest.find(',');
  if (checksum != std::string_view::npos) {
    out.checksum = std::string(rest.substr(checksum + 1));
    rest = rest.substr(0, checksum);
  }
  out.count = number_field<int64_t>(line, rest, "DA line with a non-numeric count");
  return out;
}

int64_t parse_aggregate(std::string_view line) {
  std::string_view tag = tag_of(line);
  if (tag.empty()) {
    malformed(line, "aggregate line without a tag");
  }
  return number_field<int64_t>(line, value_of(line, tag), "aggregate line with a non-numeric value");
}

std::string_view function_data_name(std::string_view line) {
  std::string_view value = value_of(line, tags::function_data);
  size_t comma = value.find(',');
  if (comma == std::string_view::npos || comma + 1 == value.size()) {
    malformed(line, "FNDA line without a function name");
  }
  return value.substr(comma + 1);
}

uint32_t line_data_number(std::string_view line) {
  std::string_view value = value_of(line, tags::line_data);
  size_t comma = value.find(',');
  if (comma == std::string_view::npos) {
    malformed(line, "DA line without a comma");
  }
  return number_field<uint32_t>(line, value.substr(0, comma), "DA line with a non-numeric line number");
}

std::string format_function_data(const function_data_line& data) {
  return std::string(tags::function_data) + ":" + std::to_string(data.count) + "," + data.name;
}

std::string format_line_data(const line_data_line& data) {
  std::string out = std::string(tags::line_data) + ":" + std::to_string(data.line) + "," + std::to_string(data.count);
  if (data.checksum) {
    out += "," + *data.checksum;
  }
  return out;
}

std::string format_aggregate(std::string_view tag, int64_t value) {
  return std::string(tag) + ":" + std::to_string(value);
}

std::optional<std::string> coverage_record::source_file() const {
  for (const auto& line : lines_) {
    if (classify(line) == line_kind::source_file) {
      return std::string(value_of(line, tags::source_file));
    }
  }
  return std::nullopt;
}

std::optional<int64_t> coverage_record::function_count(std::string_view name) const {
  for (const auto& line : lines_) {
    if (classify(line) != line_kind::function_data) {
      continue;
    }
    if (function_data_name(line) == name) {
      return parse_function_data(line).count;
    }
  }
  return std::nullopt;
}

} // namespace unitcov::lcov
