#include "env_config.hpp"

#include <cstdlib>

#include <redlog.hpp>

#include "unitcov/util/string_utils.hpp"

namespace unitcov::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(trim_view(value));
  return (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on");
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  auto parsed = parse_number<int>(trim_view(value));
  if (!parsed) {
    auto log = redlog::get_logger("unitcov.config");
    log.warn(
        "failed to parse environment value as int, using default", redlog::field("name", build_env_name(name)),
        redlog::field("value", value)
    );
    return default_value;
  }
  return *parsed;
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  std::vector<std::string> result;
  std::string value = get_env_value(name);
  if (value.empty()) {
    return result;
  }

  for (const auto& item : split(value, delimiter)) {
    std::string trimmed = trim_copy(item);
    if (!trimmed.empty()) {
      result.push_back(trimmed);
    }
  }

  return result;
}

} // namespace unitcov::util
