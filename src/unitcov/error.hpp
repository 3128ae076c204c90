#pragma once

#include <stdexcept>
#include <string>

namespace unitcov {

enum class error_code {
  malformed_line,
  io_error,
  node_not_found,
  inconsistent_aggregate,
  invalid_config
};

const char* error_code_name(error_code code) noexcept;

/**
 * @brief Exception thrown for every fatal condition of a run
 */
class error : public std::runtime_error {
public:
  explicit error(error_code code, const std::string& message) : std::runtime_error(message), code_(code) {}

  error_code code() const noexcept { return code_; }

private:
  error_code code_;
};

// logs through redlog and throws an inconsistent_aggregate error when condition is false
void ensure(bool condition, const std::string& message);

} // namespace unitcov

#define UNITCOV_ENSURE(condition, message) ::unitcov::ensure((condition), (message))
