#include <doctest/doctest.h>

#include "unitcov/error.hpp"
#include "unitcov/lcov/record.hpp"
#include "test_helpers.hpp"

using namespace unitcov;

TEST_CASE("classify recognizes the tags used for attribution") {
  CHECK(lcov::classify("SF:/src/a.c") == lcov::line_kind::source_file);
  CHECK(lcov::classify("FN:10,foo") == lcov::line_kind::function);
  CHECK(lcov::classify("FNDA:0,foo") == lcov::line_kind::function_data);
  CHECK(lcov::classify("FNH:3") == lcov::line_kind::functions_hit);
  CHECK(lcov::classify("DA:4,1") == lcov::line_kind::line_data);
  CHECK(lcov::classify("LH:7") == lcov::line_kind::lines_hit);
}

TEST_CASE("classify leaves other lines alone") {
  CHECK(lcov::classify("FNF:3") == lcov::line_kind::other);
  CHECK(lcov::classify("LF:9") == lcov::line_kind::other);
  CHECK(lcov::classify("BRDA:4,0,0,1") == lcov::line_kind::other);
  CHECK(lcov::classify("TN:") == lcov::line_kind::other);
  CHECK(lcov::classify("") == lcov::line_kind::other);
  CHECK(lcov::classify("end_of_record") == lcov::line_kind::other);
}

TEST_CASE("parse_function reads both FN layouts") {
  auto classic = lcov::parse_function("FN:42,pcmk__str_eq");
  CHECK(classic.start_line == 42);
  CHECK(!classic.end_line.has_value());
  CHECK(classic.name == "pcmk__str_eq");

  auto ranged = lcov::parse_function("FN:42,57,pcmk__str_eq");
  CHECK(ranged.start_line == 42);
  REQUIRE(ranged.end_line.has_value());
  CHECK(*ranged.end_line == 57);
  CHECK(ranged.name == "pcmk__str_eq");
}

TEST_CASE("parse_function rejects malformed lines") {
  CHECK_THROWS_AS(lcov::parse_function("FN:42"), unitcov::error);
  CHECK_THROWS_AS(lcov::parse_function("FN:abc,foo"), unitcov::error);
  CHECK_THROWS_AS(lcov::parse_function("FN:42,"), unitcov::error);

  try {
    lcov::parse_function("FN:42");
    FAIL("expected an exception");
  } catch (const unitcov::error& e) {
    CHECK(e.code() == error_code::malformed_line);
  }
}

TEST_CASE("parse_function_data and parse_line_data split their fields") {
  auto fnda = lcov::parse_function_data("FNDA:12,crm_exit_str");
  CHECK(fnda.count == 12);
  CHECK(fnda.name == "crm_exit_str");

  auto da = lcov::parse_line_data("DA:8,0");
  CHECK(da.line == 8);
  CHECK(da.count == 0);
  CHECK(!da.checksum.has_value());

  auto summed = lcov::parse_line_data("DA:8,3,Xyz0abc");
  CHECK(summed.count == 3);
  REQUIRE(summed.checksum.has_value());
  CHECK(*summed.checksum == "Xyz0abc");

  CHECK_THROWS_AS(lcov::parse_function_data("FNDA:12"), unitcov::error);
  CHECK_THROWS_AS(lcov::parse_line_data("DA:8"), unitcov::error);
  CHECK_THROWS_AS(lcov::parse_line_data("DA:8,lots"), unitcov::error);
  CHECK_THROWS_AS(lcov::parse_aggregate("FNH:"), unitcov::error);
}

TEST_CASE("key field readers skip the count") {
  CHECK(lcov::function_data_name("FNDA:99999999999999999999999,big") == "big");
  CHECK(lcov::function_data_name("FNDA:0,helper") == "helper");
  CHECK(lcov::line_data_number("DA:42,99999999999999999999999") == 42);
  CHECK(lcov::line_data_number("DA:7,1,abc") == 7);

  CHECK_THROWS_AS(lcov::function_data_name("FNDA:3,"), unitcov::error);
  CHECK_THROWS_AS(lcov::line_data_number("DA:x,1"), unitcov::error);
}

TEST_CASE("formatters write the canonical line forms") {
  CHECK(lcov::format_function_data({0, "helper"}) == "FNDA:0,helper");
  CHECK(lcov::format_line_data({12, 0, std::nullopt}) == "DA:12,0");
  CHECK(lcov::format_line_data({12, 0, std::string("abc")}) == "DA:12,0,abc");
  CHECK(lcov::format_aggregate(lcov::tags::lines_hit, 4) == "LH:4");
}

TEST_CASE("coverage_record finds its source file and function counts") {
  auto record = test::helper_pub_record();
  REQUIRE(record.source_file().has_value());
  CHECK(*record.source_file() == "/src/lib/common/strings.c");
  CHECK(record.function_count("helper") == 3);
  CHECK(record.function_count("pub") == 5);
  CHECK(!record.function_count("missing").has_value());

  CHECK(!test::make_record({"TN:"}).source_file().has_value());
}
