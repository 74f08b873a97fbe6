#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <fillcast/errors.hpp>
#include <fillcast/result_cache.hpp>

using namespace fillcast;

static ForecastResult result_with_days(int d) {
  ForecastResult r;
  r.simulated_days = {d};
  r.debug.seed = "s" + std::to_string(d);
  return r;
}

static CacheKeyInputs base_key() {
  CacheKeyInputs k;
  k.req_id = "REQ-1";
  k.pipeline = {{"a", Stage::Screen}, {"b", Stage::Onsite}};
  k.seed = "REQ-1-abc";
  return k;
}

TEST_CASE("cache key covers everything that changes output") {
  const auto k0 = make_cache_key(base_key());
  REQUIRE(make_cache_key(base_key()) == k0);

  SECTION("pipeline order does not matter") {
    auto k = base_key();
    std::swap(k.pipeline[0], k.pipeline[1]);
    REQUIRE(make_cache_key(k) == k0);
  }
  SECTION("req, seed, pipeline, knobs and levers all do") {
    auto a = base_key(); a.req_id = "REQ-2";
    auto b = base_key(); b.seed = "other";
    auto c = base_key(); c.pipeline[1].current_stage = Stage::Offer;
    auto d = base_key(); d.knobs.iterations = 2000;
    auto e = base_key(); e.levers.conversion_points[Stage::Screen] = 5.0;
    for (const auto& k : {a, b, c, d, e}) REQUIRE(make_cache_key(k) != k0);
  }
  SECTION("start date and simulated parameters do too") {
    auto start = base_key();
    start.start_date = std::chrono::sys_days{std::chrono::year{2027} / 3 / 1};
    auto rate = base_key(); rate.params.conversion_rates[Stage::Screen] = 0.6;
    auto dur = base_key(); dur.params.durations[Stage::Screen] = ConstantDuration{40.0};
    auto n = base_key(); n.params.sample_sizes["SCREEN_rate"] = 12;
    for (const auto& k : {start, rate, dur, n}) REQUIRE(make_cache_key(k) != k0);

    auto logn = base_key(); logn.params.durations[Stage::Screen] = LognormalDuration{1.6, 0.4};
    auto wider = logn; std::get<LognormalDuration>(wider.params.durations[Stage::Screen]).sigma = 0.5;
    REQUIRE(make_cache_key(logn) != make_cache_key(wider));
  }
}

TEST_CASE("ResultCache basics") {
  REQUIRE_THROWS_AS(ResultCache(0), InvalidParameter);

  ResultCache cache(3);
  REQUIRE(cache.capacity() == 3);
  REQUIRE(cache.get(1) == nullptr);

  cache.put(1, std::make_shared<const ForecastResult>(result_with_days(10)));
  auto hit = cache.get(1);
  REQUIRE(hit != nullptr);
  REQUIRE(hit->simulated_days == std::vector<int>{10});

  SECTION("entries are immutable once written") {
    cache.put(1, std::make_shared<const ForecastResult>(result_with_days(99)));
    REQUIRE(cache.get(1)->simulated_days == std::vector<int>{10});
    REQUIRE(cache.stats().inserts == 1);
  }

  SECTION("stats count hits and misses") {
    const auto s = cache.stats();
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 1);
    REQUIRE(s.inserts == 1);
  }

  SECTION("clear empties the cache") {
    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.get(1) == nullptr);
  }
}

TEST_CASE("full cache evicts the oldest insertion") {
  ResultCache cache(3);
  for (std::uint64_t k = 1; k <= 3; ++k) {
    cache.put(k, std::make_shared<const ForecastResult>(result_with_days(int(k))));
  }
  // Reading key 1 does not protect it.
  REQUIRE(cache.get(1) != nullptr);

  cache.put(4, std::make_shared<const ForecastResult>(result_with_days(4)));
  REQUIRE(cache.size() == 3);
  REQUIRE(cache.get(1) == nullptr);
  REQUIRE(cache.get(2) != nullptr);
  REQUIRE(cache.get(4) != nullptr);
  REQUIRE(cache.stats().evictions == 1);

  cache.put(5, std::make_shared<const ForecastResult>(result_with_days(5)));
  REQUIRE(cache.get(2) == nullptr);
  REQUIRE(cache.get(3) != nullptr);
  REQUIRE(cache.stats().evictions == 2);
}

TEST_CASE("get_or_compute runs the computation once per key") {
  ResultCache cache(4);
  int calls = 0;
  auto fn = [&] { ++calls; return result_with_days(18); };

  auto a = cache.get_or_compute(7, fn);
  auto b = cache.get_or_compute(7, fn);
  REQUIRE(calls == 1);
  REQUIRE(a == b);
  REQUIRE(b->simulated_days == std::vector<int>{18});

  cache.get_or_compute(8, fn);
  REQUIRE(calls == 2);
  REQUIRE(cache.size() == 2);
}

TEST_CASE("concurrent callers agree on one stored value") {
  ResultCache cache(8);
  std::atomic<int> calls{0};
  std::vector<ResultCache::Value> seen(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      seen[i] = cache.get_or_compute(42, [&] { ++calls; return result_with_days(i); });
    });
  }
  for (auto& t : threads) t.join();

  REQUIRE(calls >= 1);
  REQUIRE(cache.size() == 1);
  const auto stored = cache.get(42);
  for (const auto& v : seen) REQUIRE(v == stored);
}
