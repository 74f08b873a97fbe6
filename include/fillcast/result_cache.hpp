#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <fillcast/forecast.hpp>
#include <fillcast/levers.hpp>

namespace fillcast {

inline constexpr std::size_t kDefaultCacheCapacity = 50;

// Request identity plus the inputs the simulation reads. params are the
// parameters actually simulated (after evidence and levers are applied).
struct CacheKeyInputs {
  std::string req_id;
  std::vector<PipelineCandidate> pipeline;
  std::string seed;
  KnobSettings knobs{};
  LeverAdjustments levers{};
  Date start_date{};
  SimulationParameters params;
};

std::uint64_t make_cache_key(const CacheKeyInputs& in);

struct CacheStats {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t inserts = 0;
  std::uint64_t evictions = 0;
};

// Bounded memo of forecast results. Full cache evicts the oldest insertion
// (reads do not refresh an entry). Safe for concurrent use; entries are
// immutable once written.
class ResultCache {
public:
  using Value = std::shared_ptr<const ForecastResult>;

  explicit ResultCache(std::size_t capacity = kDefaultCacheCapacity);

  std::size_t capacity() const noexcept { return capacity_; }
  std::size_t size() const;
  CacheStats stats() const;
  void clear();

  Value get(std::uint64_t key);
  void put(std::uint64_t key, Value v);

  // Cached value for key, or fn() stored and returned. fn runs without the
  // lock held; when two callers race, the first stored value wins.
  Value get_or_compute(std::uint64_t key, const std::function<ForecastResult()>& fn);

private:
  void insert_locked_(std::uint64_t key, Value v);

  std::size_t capacity_;
  mutable std::mutex mu_;
  std::list<std::uint64_t> order_; // oldest first
  std::unordered_map<std::uint64_t, Value> map_;
  CacheStats stats_;
};

} // namespace fillcast
