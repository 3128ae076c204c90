#include "error.hpp"

#include <redlog.hpp>

namespace unitcov {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::malformed_line:
    return "malformed_line";
  case error_code::io_error:
    return "io_error";
  case error_code::node_not_found:
    return "node_not_found";
  case error_code::inconsistent_aggregate:
    return "inconsistent_aggregate";
  case error_code::invalid_config:
    return "invalid_config";
  }
  return "unknown";
}

void ensure(bool condition, const std::string& message) {
  if (!condition) {
    auto log = redlog::get_logger("unitcov");
    log.err("assertion failed", redlog::field("message", message));
    throw error(error_code::inconsistent_aggregate, "assertion failed: " + message);
  }
}

} // namespace unitcov
