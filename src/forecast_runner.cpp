#include <fillcast/forecast_runner.hpp>
#include <fillcast/errors.hpp>
#include <fillcast/log.hpp>
#include <fillcast/seed.hpp>

namespace fillcast {

ForecastRunner::ForecastRunner(std::shared_ptr<ResultCache> cache) : cache_(std::move(cache)) {
  if (!cache_) throw InvalidParameter("ForecastRunner needs a cache");
}

void ForecastRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&ForecastRunner::thread_main_, this);
}

void ForecastRunner::stop() {
  if (!running_.load()) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_.store(false);
  }
  cv_.notify_all();
  if (th_.joinable()) th_.join();
}

std::uint64_t ForecastRunner::submit(ForecastRequest req) {
  std::uint64_t ticket = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ticket = ++next_ticket_;
    if (pending_) log_debug("runner: request " + std::to_string(pending_ticket_) + " superseded");
    pending_ = std::move(req);
    pending_ticket_ = ticket;
  }
  cv_.notify_one();
  return ticket;
}

ForecastUpdate ForecastRunner::run_request(const ForecastRequest& req, ResultCache& cache, std::uint64_t ticket) {
  ForecastUpdate up;
  up.ticket = ticket;
  try {
    const SimulationParameters params = apply_levers(req.params, req.evidence, req.knobs, req.levers);
    up.seed = derive_seed(SeedInputs{req.req_id, req.pipeline, req.knobs, req.levers});
    const auto key = make_cache_key(CacheKeyInputs{req.req_id, req.pipeline, up.seed, req.knobs, req.levers,
                                                   req.start_date, params});
    up.result = cache.get_or_compute(key, [&] {
      return run_pipeline_simulation_parallel(req.pipeline, params, req.start_date, up.seed,
                                              req.knobs.iterations, req.threads);
    });
  } catch (const Error& e) {
    log_error("runner: request " + std::to_string(ticket) + " failed: " + e.what());
    up.result.reset();
    up.error = e.what();
  }
  return up;
}

void ForecastRunner::thread_main_() {
  while (true) {
    ForecastRequest req;
    std::uint64_t ticket = 0;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&] { return pending_.has_value() || !running_.load(); });
      if (!pending_) return; // stopping with nothing queued
      req = std::move(*pending_);
      pending_.reset();
      ticket = pending_ticket_;
    }

    buffer_.publish(run_request(req, *cache_, ticket));
    completed_.fetch_add(1, std::memory_order_relaxed);

    if (!running_.load()) return;
  }
}

} // namespace fillcast
