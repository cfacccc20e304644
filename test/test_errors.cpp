#include "test_common.hpp"
#include "test_types.hpp"

#include <cstring>
#include <string>
#include <vector>

using namespace tinyjson;

static void test_error_codes_have_names() {
  TINYJSON_CHECK(std::strcmp(error_code_name(error_code::ok), "ok") == 0);
  TINYJSON_CHECK(std::strcmp(error_code_name(error_code::shape_mismatch), "shape_mismatch") == 0);
  TINYJSON_CHECK(std::strcmp(error_code_name(error_code::nesting_too_deep), "nesting_too_deep") == 0);
  TINYJSON_CHECK(!tinyjson::error{});
}

static void test_offsets_point_into_stripped_text() {
  {
    // Stripped text: [1,x,3]; the bad token starts at index 3.
    auto r = decode<std::vector<int>>("[ 1,  x , 3 ]");
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
    TINYJSON_CHECK(r.err.offset == 3);
  }
  {
    // Stripped text: {"Value":true}
    auto r = decode<tinyjson_test::counter>("{ \"Value\" : true }");
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
    TINYJSON_CHECK(r.err.offset == 9);
  }
  {
    auto r = decode<int>("oops");
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
    TINYJSON_CHECK(r.err.offset == 0);
  }
}

static void test_first_error_wins() {
  auto r = decode<std::vector<int>>("[a,2,[3],true]");
  TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
  TINYJSON_CHECK(r.err.offset == 1);
  TINYJSON_CHECK(r.val == (std::vector<int>{0, 2, 0, 0}));
}

static void test_unterminated_string() {
  {
    auto r = decode<std::string>("\"abc");
    TINYJSON_CHECK_ERR(r.err, error_code::unterminated_string);
    TINYJSON_CHECK(r.err.offset == 4);
  }
  {
    // Best effort: the literal runs to the end of the input.
    auto r = decode<std::vector<std::string>>(R"(["a", "b])");
    TINYJSON_CHECK_ERR(r.err, error_code::unterminated_string);
    TINYJSON_CHECK(r.val.size() == 2);
    TINYJSON_CHECK(r.val[0] == "a");
  }
  {
    auto r = decode<value>(R"({"k": "v)");
    TINYJSON_CHECK_ERR(r.err, error_code::unterminated_string);
  }
}

static void test_null_is_not_a_failure() {
  // A null literal and a failed decode give the same value; only the error tells them apart.
  auto a = decode<int>("null");
  auto b = decode<int>("nul");
  TINYJSON_CHECK(a.val == b.val);
  TINYJSON_CHECK(!a.err);
  TINYJSON_CHECK_ERR(b.err, error_code::invalid_number);

  auto c = decode<std::vector<int>>("null");
  auto d = decode<std::vector<int>>("nope");
  TINYJSON_CHECK(c.val == d.val);
  TINYJSON_CHECK(!c.err);
  TINYJSON_CHECK_ERR(d.err, error_code::shape_mismatch);
}

static void test_deep_nesting_is_reported_not_crashing() {
  std::string json;
  for (int i = 0; i < 2000; ++i) json += '[';
  for (int i = 0; i < 2000; ++i) json += ']';
  {
    auto r = decode<value>(json);
    TINYJSON_CHECK_ERR(r.err, error_code::nesting_too_deep);
    TINYJSON_CHECK(r.val.is_array());
  }
  {
    decode_options opt;
    opt.max_depth = 4000;
    auto r = decode<value>(json, opt);
    TINYJSON_CHECK(!r.err);
  }
}

void test_errors() {
  test_error_codes_have_names();
  test_offsets_point_into_stripped_text();
  test_first_error_wins();
  test_unterminated_string();
  test_null_is_not_a_failure();
  test_deep_nesting_is_reported_not_crashing();
}
