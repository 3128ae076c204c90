#include "unitcov_config.hpp"

#include "unitcov/error.hpp"
#include "unitcov/util/env_config.hpp"

namespace unitcov {

unitcov_config unitcov_config::from_environment() {
  util::env_config loader("UNITCOV");

  unitcov_config config;
  config.source_root = loader.get<std::string>("SOURCE_ROOT", config.source_root);
  config.lib_dir = loader.get<std::string>("LIB_DIR", config.lib_dir);
  config.extra_tested = loader.get_list("TESTED");
  config.allow_missing = loader.get_list("ALLOW_MISSING");
  config.naming.private_prefix = loader.get<std::string>("PRIVATE_PREFIX", config.naming.private_prefix);
  config.naming.public_prefix = loader.get<std::string>("PUBLIC_PREFIX", config.naming.public_prefix);
  config.verbose = loader.get<int>("VERBOSE", 0);
  config.summary = loader.get<bool>("SUMMARY", false);

  return config;
}

callgraph::lookup_exception_table unitcov_config::lookup_exceptions() const {
  auto table = callgraph::lookup_exception_table::defaults();
  for (const auto& entry : allow_missing) {
    auto pair = callgraph::parse_lookup_exception(entry);
    if (!pair) {
      throw error(error_code::invalid_config, "lookup exception must be anchor:target, got '" + entry + "'");
    }
    table.add(pair->first, pair->second);
  }
  return table;
}

} // namespace unitcov
