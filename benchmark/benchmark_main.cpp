#include "bench_common.hpp"

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

using namespace tinyjson_bench;

namespace {

bench_result bench_decode_records(std::string_view json, std::size_t iters) {
  tinyjson::decoder d;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = d.decode<std::vector<item>>(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

// A fresh decoder per call: no buffer or split-list reuse.
bench_result bench_decode_records_cold(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = tinyjson::decode<std::vector<item>>(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_decode_dynamic(std::string_view json, std::size_t iters) {
  tinyjson::decoder d;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = d.decode<tinyjson::value>(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_decode_numbers(std::string_view json, std::size_t iters) {
  tinyjson::decoder d;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = d.decode<std::vector<double>>(json);
    double sum = 0.0;
    for (const double v : r.val) sum += v;
    do_not_optimize(sum);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, str_len);
  const std::string numbers = make_numbers_payload(n_objects * 16);
  std::cout << "payload bytes: " << payload.size() << "\n";
  std::cout << "numbers payload bytes: " << numbers.size() << "\n";

  // Warm-up; also builds the member table outside the timed loops.
  {
    auto r = tinyjson::decode<std::vector<item>>(payload);
    if (r.err || r.val.size() != n_objects) {
      std::cerr << "payload decode failed: " << tinyjson::error_code_name(r.err.code) << "\n";
      return 1;
    }
  }

  print_mbps("decode(records)", run_median(runs, [&] { return bench_decode_records(payload, iters); }));
  print_mbps("decode(records, fresh decoder)", run_median(runs, [&] { return bench_decode_records_cold(payload, iters); }));
  print_mbps("decode(dynamic)", run_median(runs, [&] { return bench_decode_dynamic(payload, iters); }));
  print_mbps("decode(numbers)", run_median(runs, [&] { return bench_decode_numbers(numbers, iters); }));

  return 0;
}
