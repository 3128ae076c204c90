#include <doctest/doctest.h>

#include <sstream>

#include "unitcov/error.hpp"
#include "unitcov/session.hpp"
#include "test_helpers.hpp"

using namespace unitcov;

namespace {

const char* strings_c = "static int\n"
                        "helper(int x)\n"
                        "{\n"
                        "    return x + 1;\n"
                        "}\n"
                        "\n"
                        "int\n"
                        "pub(int x)\n"
                        "{\n"
                        "    return x;\n"
                        "}\n";

const char* unrelated_ci = "graph: { title: \"strings.c\"\n"
                           "node: { title: \"pub\" label: \"pub\" }\n"
                           "node: { title: \"strings.c:helper\" label: \"helper\" }\n"
                           "}\n";

// test build of the same file, must be ignored
const char* test_build_ci = "graph: { title: \"strings.c\"\n"
                            "edge: { sourcename: \"pub\" targetname: \"strings.c:helper\" }\n"
                            "}\n";

std::string tracefile(const std::string& root) {
  return "TN:\n"
         "SF:" + root + "/lib/common/strings.c\n"
         "FN:1,helper\n"
         "FN:7,pub\n"
         "FNDA:3,helper\n"
         "FNDA:5,pub\n"
         "FNF:2\n"
         "FNH:2\n"
         "DA:4,3\n"
         "DA:10,5\n"
         "LF:2\n"
         "LH:2\n"
         "end_of_record\n"
         "TN:\n"
         "SF:" + root + "/lib/other/nograph.c\n"
         "FN:1,untested\n"
         "FNDA:1,untested\n"
         "FNH:1\n"
         "DA:2,1\n"
         "LH:1\n"
         "end_of_record\n";
}

struct fixture {
  test::temp_dir root;
  std::filesystem::path info;

  fixture() {
    root.write("lib/common/strings.c", strings_c);
    root.write("lib/common/tests/strings/pub_test.c", "int main(void) { return 0; }\n");
    root.write("lib/common/libcrmcommon_la-strings.ci", unrelated_ci);
    root.write("lib/common/libcrmcommon_test_la-strings.ci", test_build_ci);
    info = root.write("coverage.info", tracefile(root.path().string()));
  }

  unitcov_config config() const {
    unitcov_config out;
    out.source_root = root.path().string();
    return out;
  }
};

} // namespace

TEST_CASE("session discovers its inputs under the source root") {
  fixture fx;
  session s(fx.config());
  s.initialize();

  CHECK(s.is_initialized());
  CHECK(s.tested_functions().count("pub") == 1);
  CHECK(s.restricted_functions().count("helper") == 1);
  CHECK(s.locator().callgraphs() == std::vector<std::string>{"lib/common/libcrmcommon_la-strings.ci"});
}

TEST_CASE("session rewrites a tracefile record by record") {
  fixture fx;
  session s(fx.config());

  std::ostringstream output;
  auto summary = s.run(fx.info.string(), output);

  const std::string root = fx.root.path().string();
  const std::string expected = "TN:\n"
                               "SF:" + root + "/lib/common/strings.c\n"
                               "FN:1,helper\n"
                               "FN:7,pub\n"
                               "FNDA:0,helper\n"
                               "FNDA:5,pub\n"
                               "FNF:2\n"
                               "FNH:1\n"
                               "DA:4,0\n"
                               "DA:10,5\n"
                               "LF:2\n"
                               "LH:1\n"
                               "end_of_record\n"
                               "TN:\n"
                               "SF:" + root + "/lib/other/nograph.c\n"
                               "FN:1,untested\n"
                               "FNDA:1,untested\n"
                               "FNH:1\n"
                               "DA:2,1\n"
                               "LH:1\n"
                               "end_of_record\n";
  CHECK(output.str() == expected);

  CHECK(summary.records == 2);
  CHECK(summary.records_without_call_graph == 1);
  CHECK(summary.count(attribution::decision::erased_unreachable) == 1);
  CHECK(summary.count(attribution::decision::kept_tested) == 1);
}

TEST_CASE("session honors extra tested names") {
  fixture fx;
  auto config = fx.config();
  config.extra_tested = {"helper"};
  config.lib_dir = "no_such_dir";
  session s(config);

  std::ostringstream output;
  auto summary = s.run(fx.info.string(), output);

  CHECK(summary.erased() == 0);
  CHECK(output.str() == tracefile(fx.root.path().string()));
}

TEST_CASE("session stops on a malformed record") {
  fixture fx;
  auto bad = fx.root.write(
      "bad.info", "SF:" + fx.root.path().string() + "/lib/common/strings.c\nFN:1helper\nend_of_record\n"
  );
  session s(fx.config());

  std::ostringstream output;
  try {
    s.run(bad.string(), output);
    FAIL("expected an exception");
  } catch (const unitcov::error& e) {
    CHECK(e.code() == error_code::malformed_line);
  }
  CHECK(output.str().empty());
}

TEST_CASE("session rejects records before initialize") {
  fixture fx;
  session s(fx.config());
  CHECK_THROWS_AS(s.process_record(test::helper_pub_record()), unitcov::error);
}
