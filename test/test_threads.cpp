#include "test_common.hpp"
#include "test_types.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace tinyjson;

static std::string make_status_json(int n) {
  std::string s = "{\"presences\":[";
  for (int i = 0; i < n; ++i) {
    if (i) s += ',';
    s += "{\"persistence\":";
    s += (i % 2) ? "true" : "false";
    s += ",\"session_id\":\"s-" + std::to_string(i) + "\"";
    s += ",\"status\":\"st\",\"username\":\"user" + std::to_string(i) + "\"";
    s += ",\"user_id\":\"u-" + std::to_string(i) + "\"}";
  }
  s += "]}";
  return s;
}

// Member tables are built on first use from several threads at once; every thread
// owns its own decoder.
void test_threads() {
  const std::string json = make_status_json(50);
  constexpr int kThreads = 8;
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&json, &failures] {
      decoder d;
      for (int iter = 0; iter < 50; ++iter) {
        auto r = d.decode<tinyjson_test::status>(json);
        if (r.err || r.val.presences.size() != 50 || r.val.presences[49].username != "user49" ||
            !r.val.presences[1].persistence) {
          failures.fetch_add(1);
        }
        auto g = d.decode<tinyjson_test::group>(R"({"id":"g","name":"n","edge_count":2})");
        if (g.err || g.val.id != "g" || g.val.edge_count != 2) failures.fetch_add(1);
      }
    });
  }
  for (auto& w : workers) w.join();
  TINYJSON_CHECK(failures.load() == 0);
  TINYJSON_CHECK(&describe<tinyjson_test::status>() == &describe<tinyjson_test::status>());
}
