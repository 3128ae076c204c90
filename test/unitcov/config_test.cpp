#include <doctest/doctest.h>

#include <cstdlib>

#include "unitcov/error.hpp"
#include "unitcov/unitcov_config.hpp"
#include "unitcov/util/env_config.hpp"

using namespace unitcov;

namespace {

// sets an environment variable for the lifetime of the guard
class env_guard {
public:
  env_guard(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~env_guard() { ::unsetenv(name_); }

  env_guard(const env_guard&) = delete;
  env_guard& operator=(const env_guard&) = delete;

private:
  const char* name_;
};

} // namespace

TEST_CASE("env_config reads prefixed typed values") {
  env_guard text("UNITCOV_TEST_TEXT", "hello");
  env_guard flag("UNITCOV_TEST_FLAG", "Yes");
  env_guard number("UNITCOV_TEST_NUMBER", " 3 ");
  env_guard bad_number("UNITCOV_TEST_BAD", "three");
  env_guard list("UNITCOV_TEST_LIST", "a, b,,c ");

  util::env_config loader("UNITCOV");
  CHECK(loader.get<std::string>("TEST_TEXT", "x") == "hello");
  CHECK(loader.get<std::string>("TEST_UNSET", "x") == "x");
  CHECK(loader.get<bool>("TEST_FLAG", false));
  CHECK(loader.get<int>("TEST_NUMBER", 0) == 3);
  CHECK(loader.get<int>("TEST_BAD", 7) == 7);
  CHECK(loader.get_list("TEST_LIST") == std::vector<std::string>{"a", "b", "c"});
  CHECK(loader.get_list("TEST_UNSET").empty());
}

TEST_CASE("unitcov_config defaults") {
  auto config = unitcov_config::from_environment();
  CHECK(config.source_root == ".");
  CHECK(config.lib_dir == "lib");
  CHECK(config.naming.private_prefix == "pcmk__");
  CHECK(config.naming.public_prefix == "pcmk_");
  CHECK(config.extra_tested.empty());
  CHECK(!config.summary);
}

TEST_CASE("unitcov_config reads UNITCOV_ variables") {
  env_guard root("UNITCOV_SOURCE_ROOT", "/src/pacemaker");
  env_guard lib("UNITCOV_LIB_DIR", "libs");
  env_guard tested("UNITCOV_TESTED", "foo,bar");
  env_guard allow("UNITCOV_ALLOW_MISSING", "a:b");
  env_guard verbose("UNITCOV_VERBOSE", "2");
  env_guard summary("UNITCOV_SUMMARY", "1");

  auto config = unitcov_config::from_environment();
  CHECK(config.source_root == "/src/pacemaker");
  CHECK(config.lib_dir == "libs");
  CHECK(config.extra_tested == std::vector<std::string>{"foo", "bar"});
  CHECK(config.allow_missing == std::vector<std::string>{"a:b"});
  CHECK(config.verbose == 2);
  CHECK(config.summary);
}

TEST_CASE("lookup_exceptions extends the default table") {
  unitcov_config config;
  config.allow_missing = {"pcmk__foo:bar"};

  auto table = config.lookup_exceptions();
  CHECK(table.contains("pcmk__foo", "bar"));
  CHECK(table.contains("pe__cmp_rsc_priority", "resource_node_score"));
  CHECK(table.size() == callgraph::lookup_exception_table::defaults().size() + 1);
}

TEST_CASE("lookup_exceptions rejects malformed entries") {
  unitcov_config config;
  config.allow_missing = {"no_colon"};

  try {
    (void) config.lookup_exceptions();
    FAIL("expected an exception");
  } catch (const unitcov::error& e) {
    CHECK(e.code() == error_code::invalid_config);
  }
}
