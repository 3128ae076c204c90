#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace unitcov::util {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline std::string_view trim_view(std::string_view value) {
  constexpr std::string_view whitespace = " \t\r\n";
  size_t first = value.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return std::string_view();
  }
  size_t last = value.find_last_not_of(whitespace);
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
  std::vector<std::string> tokens;
  size_t start = 0;
  while (true) {
    size_t pos = value.find(delimiter, start);
    if (pos == std::string_view::npos) {
      tokens.emplace_back(value.substr(start));
      break;
    }
    tokens.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return tokens;
}

// parses the whole of value as a decimal integer, nullopt on any trailing garbage
template <typename T> std::optional<T> parse_number(std::string_view value) {
  T out{};
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(begin, end, out);
  if (value.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return out;
}

inline bool is_identifier_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

} // namespace unitcov::util
