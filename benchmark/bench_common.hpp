#pragma once

#include <tinyjson/tinyjson.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace tinyjson_bench {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

struct item {
  std::int64_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};
};

// Array of `item` objects. Every number in `val` carries a '.', so dynamic decoding sees doubles.
inline std::string make_payload(std::size_t n_objects, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 72));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s += ", ";
    s += "{\"id\": ";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ", \"ok\": ";
    s += (i % 2 == 0) ? "true" : "false";
    s += ", \"name\": \"";
    for (std::size_t k = 0; k < str_len; ++k) s.push_back(static_cast<char>(ch(rng)));
    if ((i % 16) == 0) s += "\\n\\u4F60\\u597D";
    s += "\", \"val\": ";
    s += (i % 3 == 0) ? "3.141592653589793" : "1.0e-10";
    s += "}";
  }
  s.push_back(']');
  return s;
}

inline std::string make_numbers_payload(std::size_t n_numbers) {
  std::string s;
  s.reserve(n_numbers * 24);
  s.push_back('[');
  for (std::size_t i = 0; i < n_numbers; ++i) {
    if (i) s.push_back(',');
    switch (i & 3u) {
      case 0: s += "3.141592653589793"; break;
      case 1: s += "-0.000000000123456789"; break;
      case 2: s += "1.234567890123456e-200"; break;
      default: s += "2.2250738585072014e-308"; break;
    }
  }
  s.push_back(']');
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

inline void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace tinyjson_bench

namespace tinyjson {

template <>
struct record_traits<tinyjson_bench::item> {
  static void describe(record_schema<tinyjson_bench::item>& s) {
    TINYJSON_FIELD(s, tinyjson_bench::item, id);
    TINYJSON_FIELD(s, tinyjson_bench::item, ok);
    TINYJSON_FIELD(s, tinyjson_bench::item, name);
    TINYJSON_FIELD(s, tinyjson_bench::item, val);
  }
};

} // namespace tinyjson
