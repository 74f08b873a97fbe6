#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <fillcast/forecast.hpp>
#include <fillcast/latest_buffer.hpp>
#include <fillcast/levers.hpp>
#include <fillcast/result_cache.hpp>

namespace fillcast {

// One what-if forecast to run in the background.
struct ForecastRequest {
  std::string req_id;
  std::vector<PipelineCandidate> pipeline;
  SimulationParameters params;
  std::map<Stage, StageEvidence> evidence;
  Date start_date{};
  KnobSettings knobs{};
  LeverAdjustments levers{};
  int threads = 1;
};

struct ForecastUpdate {
  std::uint64_t ticket = 0;                     // submit() ticket it answers
  std::shared_ptr<const ForecastResult> result; // null when error is set
  std::string seed;
  std::string error;
};

using ForecastBuffer = LatestBuffer<ForecastUpdate>;

// Owns the forecast thread and publishes results. Only the latest pending
// request runs; requests replaced before the thread picks them up are dropped.
class ForecastRunner {
public:
  explicit ForecastRunner(std::shared_ptr<ResultCache> cache = std::make_shared<ResultCache>());
  ~ForecastRunner() { stop(); }
  ForecastRunner(const ForecastRunner&) = delete;
  ForecastRunner& operator=(const ForecastRunner&) = delete;

  void start();
  void stop(); // finishes the request in flight, then joins

  // Safe to call from the UI thread. Returns the request's ticket.
  std::uint64_t submit(ForecastRequest req);

  ForecastBuffer& buffer() { return buffer_; }
  const ForecastBuffer& buffer() const { return buffer_; }
  ResultCache& cache() { return *cache_; }

  std::uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }

  // Synchronous path used by the thread; exposed for callers without one.
  static ForecastUpdate run_request(const ForecastRequest& req, ResultCache& cache, std::uint64_t ticket);

private:
  void thread_main_();

  std::shared_ptr<ResultCache> cache_;
  ForecastBuffer buffer_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> completed_{0};

  std::mutex mu_;
  std::condition_variable cv_;
  std::optional<ForecastRequest> pending_; // guarded by mu_
  std::uint64_t pending_ticket_ = 0;       // guarded by mu_
  std::uint64_t next_ticket_ = 0;          // guarded by mu_
};

} // namespace fillcast
