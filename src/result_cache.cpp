#include <fillcast/result_cache.hpp>
#include <fillcast/errors.hpp>
#include <fillcast/hashing.hpp>
#include <fillcast/log.hpp>
#include <fillcast/seed.hpp>

namespace fillcast {

std::uint64_t make_cache_key(const CacheKeyInputs& in) {
  Fnv1a64 h;
  h.update_string(in.req_id);
  h.update_u64(pipeline_hash(in.pipeline));
  h.update_string(in.seed);
  hash_knobs(h, in.knobs);
  hash_levers(h, in.levers);
  h.update_i64(in.start_date.time_since_epoch().count());
  hash_parameters(h, in.params);
  return h.value();
}

ResultCache::ResultCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw InvalidParameter("ResultCache capacity must be > 0");
}

std::size_t ResultCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.size();
}

CacheStats ResultCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  map_.clear();
  order_.clear();
}

ResultCache::Value ResultCache::get(std::uint64_t key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) {
    ++stats_.misses;
    return nullptr;
  }
  ++stats_.hits;
  return it->second;
}

void ResultCache::put(std::uint64_t key, Value v) {
  std::lock_guard<std::mutex> lk(mu_);
  insert_locked_(key, std::move(v));
}

void ResultCache::insert_locked_(std::uint64_t key, Value v) {
  if (map_.count(key)) return; // immutable once written
  while (map_.size() >= capacity_ && !order_.empty()) {
    const auto oldest = order_.front();
    order_.pop_front();
    map_.erase(oldest);
    ++stats_.evictions;
    log_debug("cache: evicted " + hash_to_hex(oldest));
  }
  order_.push_back(key);
  map_.emplace(key, std::move(v));
  ++stats_.inserts;
}

ResultCache::Value ResultCache::get_or_compute(std::uint64_t key, const std::function<ForecastResult()>& fn) {
  if (auto hit = get(key)) return hit;

  auto fresh = std::make_shared<const ForecastResult>(fn());

  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = map_.find(key); it != map_.end()) return it->second;
  insert_locked_(key, fresh);
  return fresh;
}

} // namespace fillcast
