#include "test_common.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace tinyjson;

static void test_integers() {
  {
    auto r = decode<int>("123");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(r.val == 123);
  }
  {
    TINYJSON_CHECK(from_json<int>("-42") == -42);
    TINYJSON_CHECK(from_json<int>("+7") == 7);
    TINYJSON_CHECK(from_json<int>(" 15 ") == 15);
  }
  {
    TINYJSON_CHECK(from_json<std::int64_t>("-9223372036854775808") == (std::numeric_limits<std::int64_t>::min)());
    TINYJSON_CHECK(from_json<std::int64_t>("9223372036854775807") == (std::numeric_limits<std::int64_t>::max)());
  }
}

static void test_integer_failures_give_zero() {
  const char* bad[] = {
      "",
      "-",
      "+",
      "+-1",
      "1.5",
      "1e3",
      "0x10",
      "12abc",
      "\"12\"",
      "2147483648",
  };
  for (const char* s : bad) {
    auto r = decode<int>(s);
    TINYJSON_CHECK(r.val == 0);
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
  }
}

static void test_bytes() {
  TINYJSON_CHECK(from_json<std::uint8_t>("0") == 0);
  TINYJSON_CHECK(from_json<std::uint8_t>("255") == 255);
  {
    auto r = decode<std::uint8_t>("256");
    TINYJSON_CHECK(r.val == 0);
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
  }
  {
    auto r = decode<std::uint8_t>("-1");
    TINYJSON_CHECK(r.val == 0);
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
  }
  static_assert(shape_of<std::uint8_t>() == shape::byte, "uint8_t decodes as a byte");
  static_assert(shape_of<short>() == shape::integer, "short decodes as an integer");
}

static void test_floating_point() {
  {
    auto r = decode<double>("1.25");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(tinyjson_test::nearly_equal(r.val, 1.25));
  }
  {
    TINYJSON_CHECK(tinyjson_test::nearly_equal(from_json<double>("-3.14159e-2"), -0.0314159));
    TINYJSON_CHECK(tinyjson_test::nearly_equal(from_json<double>("1E+10"), 1e10));
    TINYJSON_CHECK(tinyjson_test::nearly_equal(from_json<double>("+2.5"), 2.5));
    TINYJSON_CHECK(tinyjson_test::nearly_equal(from_json<double>("10"), 10.0));
  }
  {
    auto r = decode<float>("0.5");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(r.val == 0.5f);
  }
  static_assert(shape_of<float>() == shape::floating, "float decodes as floating");
  static_assert(shape_of<double>() == shape::double_precision, "double decodes as double");
}

static void test_floating_failures_give_zero() {
  const char* bad[] = {
      "",
      "abc",
      "1.2.3",
      "1,5",
      "\"1.5\"",
      "1e",
  };
  for (const char* s : bad) {
    auto r = decode<double>(s);
    TINYJSON_CHECK(r.val == 0.0);
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_number);
  }
}

static void test_booleans() {
  TINYJSON_CHECK(from_json<bool>("true") == true);
  TINYJSON_CHECK(from_json<bool>("TRUE") == true);
  TINYJSON_CHECK(from_json<bool>("True") == true);
  {
    auto r = decode<bool>("false");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(r.val == false);
  }
  {
    auto r = decode<bool>("yes");
    TINYJSON_CHECK(r.val == false);
    TINYJSON_CHECK_ERR(r.err, error_code::invalid_literal);
  }
  {
    auto r = decode<bool>("1");
    TINYJSON_CHECK(r.val == false);
    TINYJSON_CHECK(r.err);
  }
}

static void test_null_is_absence_for_numbers() {
  {
    auto r = decode<int>("null");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(r.val == 0);
  }
  {
    auto r = decode<std::optional<double>>("null");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(!r.val.has_value());
  }
  {
    auto r = decode<std::optional<double>>("2.5");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(r.val.has_value() && *r.val == 2.5);
  }
  {
    auto r = decode<bool>("null");
    TINYJSON_CHECK(!r.err);
    TINYJSON_CHECK(r.val == false);
  }
}

void test_numbers() {
  test_integers();
  test_integer_failures_give_zero();
  test_bytes();
  test_floating_point();
  test_floating_failures_give_zero();
  test_booleans();
  test_null_is_absence_for_numbers();
}
