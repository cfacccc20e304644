#include "bench_common.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>

using namespace tinyjson_bench;

namespace {

// Each library decodes the payload into the same std::vector<item>.

bench_result bench_tinyjson(std::string_view json, std::size_t iters) {
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

bench_result bench_nlohmann(std::string_view json_text, std::size_t iters) {
  using nlohmann::json;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    const json j = json::parse(json_text, /*callback=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
    std::vector<item> out;
    if (j.is_array()) {
      out.reserve(j.size());
      for (const auto& e : j) {
        item it;
        it.id = e.at("id").get<std::int64_t>();
        it.ok = e.at("ok").get<bool>();
        it.name = e.at("name").get<std::string>();
        it.val = e.at("val").get<double>();
        out.push_back(std::move(it));
      }
    }
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

bench_result bench_jsoncpp(std::string_view json, std::size_t iters) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["strictRoot"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Json::Value root;
    std::string errs;
    const bool ok = reader->parse(json.data(), json.data() + json.size(), &root, &errs);
    std::vector<item> out;
    if (ok && root.isArray()) {
      out.reserve(root.size());
      for (const Json::Value& e : root) {
        item it;
        it.id = e["id"].asInt64();
        it.ok = e["ok"].asBool();
        it.name = e["name"].asString();
        it.val = e["val"].asDouble();
        out.push_back(std::move(it));
      }
    }
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_rapidjson(std::string_view json_text, std::size_t iters) {
  using namespace rapidjson;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Document d;
    d.Parse(json_text.data(), json_text.size());
    std::vector<item> out;
    if (!d.HasParseError() && d.IsArray()) {
      out.reserve(d.Size());
      for (const auto& e : d.GetArray()) {
        item it;
        it.id = e["id"].GetInt64();
        it.ok = e["ok"].GetBool();
        it.name.assign(e["name"].GetString(), e["name"].GetStringLength());
        it.val = e["val"].GetDouble();
        out.push_back(std::move(it));
      }
    }
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

bench_result bench_tinyjson_sum_numbers(std::string_view json, std::size_t iters) {
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

bench_result bench_rapidjson_sum_numbers(std::string_view json_text, std::size_t iters) {
  using namespace rapidjson;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Document d;
    d.Parse(json_text.data(), json_text.size());
    if (d.HasParseError() || !d.IsArray()) {
      std::cerr << "rapidjson: input parse failed (numbers)\n";
      std::exit(1);
    }
    double sum = 0.0;
    for (auto& v : d.GetArray()) sum += v.GetDouble();
    do_not_optimize(sum);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, 24);
  const std::string numbers = make_numbers_payload(n_objects * 16);
  std::cout << "payload bytes: " << payload.size() << "\n";
  std::cout << "numbers payload bytes: " << numbers.size() << "\n";

  // Warm-up
  {
    auto r = tinyjson::decode<std::vector<item>>(payload);
    if (r.err) {
      std::cerr << "tinyjson: payload decode failed: " << tinyjson::error_code_name(r.err.code) << "\n";
      return 1;
    }
  }
  {
    rapidjson::Document d;
    d.Parse(payload.data(), payload.size());
    do_not_optimize(d.GetType());
  }

  std::cout << "\n== Decode into records ==\n";
  print_mbps("tinyjson", run_median(runs, [&] { return bench_tinyjson(payload, iters); }));
  print_mbps("nlohmann", run_median(runs, [&] { return bench_nlohmann(payload, iters); }));
  print_mbps("jsoncpp", run_median(runs, [&] { return bench_jsoncpp(payload, iters); }));
  print_mbps("rapidjson", run_median(runs, [&] { return bench_rapidjson(payload, iters); }));

  std::cout << "\n== Decode+sum (numbers) ==\n";
  print_mbps("tinyjson +sum", run_median(runs, [&] { return bench_tinyjson_sum_numbers(numbers, iters); }));
  print_mbps("rapidjson +sum", run_median(runs, [&] { return bench_rapidjson_sum_numbers(numbers, iters); }));

  return 0;
}
