#include <fillcast/forecast.hpp>
#include <fillcast/errors.hpp>
#include <fillcast/hashing.hpp>
#include <fillcast/log.hpp>
#include <algorithm>
#include <climits>
#include <cmath>
#include <exception>
#include <sstream>
#include <system_error>
#include <thread>

namespace fillcast {

namespace {

struct FunnelStep {
  Stage stage;
  double rate;
  const DurationDistribution* dist; // null => kDefaultStageDays
};

using Funnel = std::vector<FunnelStep>;

const DurationDistribution& fallback_duration() {
  static const DurationDistribution d = ConstantDuration{kDefaultStageDays};
  return d;
}

// Funnel stages that carry a conversion rate, in walk order.
Funnel build_funnel(const SimulationParameters& p) {
  Funnel f;
  for (Stage s : kFunnelStages) {
    auto r = p.conversion_rates.find(s);
    if (r == p.conversion_rates.end()) continue;
    auto d = p.durations.find(s);
    f.push_back({s, r->second, d == p.durations.end() ? nullptr : &d->second});
  }
  return f;
}

void validate_inputs(const SimulationParameters& p, int iterations) {
  if (iterations < 0) {
    throw InvalidParameter("iterations must be >= 0 (got " + std::to_string(iterations) + ")");
  }
  for (const auto& [stage, rate] : p.conversion_rates) {
    if (!std::isfinite(rate) || rate < 0.0 || rate > 1.0) {
      throw InvalidParameter(std::string("conversion rate for ") + to_string(stage) +
                             " must be in [0,1]");
    }
  }
  for (const auto& [stage, d] : p.durations) validate_duration(d);
}

std::optional<int> walk(const Funnel& f, Stage from, std::mt19937& rng) {
  if (from == Stage::Hired) return 0;
  if (from == Stage::Rejected || from == Stage::Withdrew) return std::nullopt;

  std::uniform_real_distribution<double> U(0.0, 1.0);
  int days = 0;
  for (const auto& step : f) {
    if (static_cast<int>(step.stage) < static_cast<int>(from)) continue;
    if (!(U(rng) < step.rate)) return std::nullopt; // dropped
    days += sample_duration(step.dist ? *step.dist : fallback_duration(), rng);
  }
  return days;
}

// Successful samples of block b, in iteration order.
std::vector<int> run_block(const Funnel& f, const std::vector<Stage>& starts,
                           const std::string& seed, int block, int count) {
  std::mt19937 rng = block_rng(seed, static_cast<std::uint64_t>(block));
  std::vector<int> out;
  out.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    int best = INT_MAX;
    for (Stage s : starts) {
      if (auto d = walk(f, s, rng); d && *d < best) best = *d;
    }
    if (best != INT_MAX) out.push_back(best);
  }
  return out;
}

std::vector<int> run_blocks(const Funnel& f, const std::vector<Stage>& starts,
                            const std::string& seed, int iterations, int threads) {
  const int n_blocks = (iterations + kIterationsPerBlock - 1) / kIterationsPerBlock;
  auto block_size = [&](int b) { return std::min(kIterationsPerBlock, iterations - b * kIterationsPerBlock); };

  std::vector<std::vector<int>> per_block(static_cast<std::size_t>(n_blocks));
  const int workers = std::max(1, std::min(threads, n_blocks));

  if (workers == 1) {
    for (int b = 0; b < n_blocks; ++b) per_block[b] = run_block(f, starts, seed, b, block_size(b));
  } else {
    std::vector<std::thread> pool;
    std::vector<std::exception_ptr> errors(static_cast<std::size_t>(workers));
    pool.reserve(static_cast<std::size_t>(workers));
    try {
      for (int t = 0; t < workers; ++t) {
        pool.emplace_back([&, t] {
          try {
            for (int b = t; b < n_blocks; b += workers) {
              per_block[b] = run_block(f, starts, seed, b, block_size(b));
            }
          } catch (...) {
            errors[t] = std::current_exception(); // rethrown on the calling thread
          }
        });
      }
    } catch (const std::system_error& e) {
      // Thread creation failed: let the started workers finish before leaving.
      for (auto& th : pool) th.join();
      log_error(std::string("simulation: could not start worker threads: ") + e.what());
      throw;
    }
    for (auto& th : pool) th.join();
    for (const auto& e : errors) {
      if (e) std::rethrow_exception(e);
    }
  }

  // Merge in block order; independent of how blocks were scheduled.
  std::vector<int> all;
  for (auto& v : per_block) all.insert(all.end(), v.begin(), v.end());
  return all;
}

std::string percent(double x) {
  std::ostringstream oss;
  oss << static_cast<int>(std::lround(x * 100.0)) << "%";
  return oss.str();
}

Confidence assess_confidence(const SimulationParameters& p, const Funnel& f,
                             const ForecastResult& r, bool pipeline_mode,
                             std::vector<std::string>& reasons) {
  // Evidence behind the stages that were actually walked.
  std::optional<int> min_n;
  for (const auto& step : f) {
    for (const auto& key : {rate_key(step.stage), duration_key(step.stage)}) {
      const auto n = sample_size(p, key);
      if (!n) continue;
      min_n = min_n ? std::min(*min_n, *n) : *n;
      if (*n < kMinStageSamples) {
        const bool is_rate = key == rate_key(step.stage);
        reasons.push_back(key + " has n=" + std::to_string(*n) + " (< " +
                          std::to_string(kMinStageSamples) + "); " +
                          (is_rate ? "rate relies on shrinkage toward the prior"
                                   : "duration relies on the fallback estimate"));
      }
    }
  }

  Confidence c = Confidence::Low;
  if (!min_n) {
    reasons.push_back("No stage sample sizes supplied");
  } else if (*min_n >= 15) {
    c = Confidence::High;
  } else if (*min_n >= 5) {
    c = Confidence::Medium;
  } else {
    reasons.push_back("Minimum stage sample size is " + std::to_string(*min_n));
  }

  if (pipeline_mode) {
    const double s = r.success_probability;
    if (s < 0.5) {
      c = Confidence::Low;
      reasons.push_back("Only " + percent(s) + " of iterations produced a hire");
    } else if (s < 0.8 && c == Confidence::High) {
      c = Confidence::Medium;
      reasons.push_back(percent(s) + " of iterations produced a hire");
    }
  }

  const auto n = static_cast<int>(r.simulated_days.size());
  if (n < kMinSamplesForConfidence) {
    c = Confidence::Low;
    reasons.push_back("Only " + std::to_string(n) + " successful iterations");
  }

  const int p10 = percentile_days(r.simulated_days, 10);
  const int p50 = percentile_days(r.simulated_days, 50);
  const int p90 = percentile_days(r.simulated_days, 90);
  const double spread = double(p90 - p10) / double(std::max(1, p50));
  if (spread > 2.0) {
    c = std::max(Confidence::Low, downgrade(c));
    reasons.push_back("Wide spread: P10-P90 spans " + std::to_string(p90 - p10) +
                      " days around a P50 of " + std::to_string(p50));
  }
  return c;
}

ForecastResult summarize(std::vector<int> samples, const SimulationParameters& p,
                         const Funnel& f, Date start_date, const std::string& seed,
                         int iterations, bool pipeline_mode) {
  ForecastResult r;
  r.debug = {seed, iterations, static_cast<int>(samples.size())};
  std::sort(samples.begin(), samples.end());
  r.simulated_days = std::move(samples);
  r.success_probability = iterations > 0 ? double(r.debug.successful_iterations) / iterations : 0.0;

  if (r.simulated_days.empty()) {
    const Date horizon = add_days(start_date, kNoFillHorizonDays);
    r.p10_date = r.p50_date = r.p90_date = horizon;
    r.confidence = Confidence::Low;
    r.confidence_reasons.push_back("No iteration reached HIRED");
    log_warn("simulation seed=" + seed + ": no hires in " + std::to_string(iterations) + " iterations");
    return r;
  }

  r.p10_date = add_days(start_date, percentile_days(r.simulated_days, 10));
  r.p50_date = add_days(start_date, percentile_days(r.simulated_days, 50));
  r.p90_date = add_days(start_date, percentile_days(r.simulated_days, 90));
  r.confidence = assess_confidence(p, f, r, pipeline_mode, r.confidence_reasons);

  log_debug("simulation seed=" + seed + ": " + std::to_string(r.debug.successful_iterations) +
            "/" + std::to_string(iterations) + " hires, confidence " + to_string(r.confidence));
  return r;
}

std::vector<Stage> active_starts(const std::vector<PipelineCandidate>& candidates) {
  std::vector<Stage> starts;
  starts.reserve(candidates.size());
  for (const auto& c : candidates) {
    if (is_terminal(c.current_stage)) continue;
    starts.push_back(c.current_stage);
  }
  return starts;
}

} // namespace

std::mt19937 block_rng(const std::string& seed, std::uint64_t block) {
  const std::uint64_t s = mix64(hash_string(seed) ^ mix64(block));
  std::seed_seq seq{static_cast<std::uint32_t>(s), static_cast<std::uint32_t>(s >> 32)};
  return std::mt19937(seq);
}

int percentile_days(const std::vector<int>& sorted_days, int pct) {
  if (sorted_days.empty()) return 0;
  const long n = static_cast<long>(sorted_days.size());
  const int p = std::clamp(pct, 1, 100);
  long rank = (p * n + 99) / 100; // ceil(p/100 * n)
  rank = std::clamp(rank, 1L, n);
  return sorted_days[static_cast<std::size_t>(rank - 1)];
}

std::optional<int> simulate_candidate(Stage from, const SimulationParameters& params, std::mt19937& rng) {
  validate_inputs(params, 0);
  return walk(build_funnel(params), from, rng);
}

ForecastResult run_simulation(const SingleCandidateContext& ctx, const SimulationParameters& params) {
  validate_inputs(params, ctx.iterations);
  const Funnel f = build_funnel(params);
  std::vector<Stage> starts;
  if (ctx.current_stage != Stage::Rejected && ctx.current_stage != Stage::Withdrew) {
    starts.push_back(ctx.current_stage);
  }
  auto samples = run_blocks(f, starts, ctx.seed, ctx.iterations, 1);
  return summarize(std::move(samples), params, f, ctx.start_date, ctx.seed, ctx.iterations, false);
}

ForecastResult run_pipeline_simulation(const std::vector<PipelineCandidate>& candidates,
                                       const SimulationParameters& params,
                                       Date start_date,
                                       const std::string& seed,
                                       int iterations) {
  return run_pipeline_simulation_parallel(candidates, params, start_date, seed, iterations, 1);
}

ForecastResult run_pipeline_simulation_parallel(const std::vector<PipelineCandidate>& candidates,
                                                const SimulationParameters& params,
                                                Date start_date,
                                                const std::string& seed,
                                                int iterations,
                                                int threads) {
  validate_inputs(params, iterations);
  if (threads <= 0) threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
  const Funnel f = build_funnel(params);
  auto samples = run_blocks(f, active_starts(candidates), seed, iterations, threads);
  return summarize(std::move(samples), params, f, start_date, seed, iterations, true);
}

std::optional<double> probability_by_target(const ForecastResult& r, Date start_date, Date target) {
  if (r.simulated_days.empty()) return std::nullopt;
  const int limit = days_between(start_date, target);
  const auto hit = std::upper_bound(r.simulated_days.begin(), r.simulated_days.end(), limit);
  return double(hit - r.simulated_days.begin()) / double(r.simulated_days.size());
}

} // namespace fillcast
