#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <fillcast/params.hpp>
#include <fillcast/types.hpp>

namespace fillcast {

inline constexpr int kDefaultIterations = 1000;
inline constexpr int kIterationsPerBlock = 256;  // RNG stream granularity
inline constexpr int kNoFillHorizonDays = 365;   // dates reported for an empty run
inline constexpr int kMinStageSamples = 5;       // stages below this are called out
inline constexpr int kMinSamplesForConfidence = 100;

struct ForecastDebug {
  std::string seed;
  int iterations = 0;
  int successful_iterations = 0;
};

struct ForecastResult {
  std::vector<int> simulated_days; // ascending; one entry per successful iteration
  Date p10_date{};
  Date p50_date{};
  Date p90_date{};
  Confidence confidence = Confidence::Low;
  std::vector<std::string> confidence_reasons;
  double success_probability = 0.0; // successful_iterations / iterations
  ForecastDebug debug;

  // No iteration reached HIRED.
  bool empty() const { return simulated_days.empty(); }
};

struct SingleCandidateContext {
  Stage current_stage = Stage::Screen;
  Date start_date{};
  std::string seed;
  int iterations = kDefaultIterations;
};

// One candidate walked through the funnel per iteration. Each hire contributes
// its elapsed days; drops contribute nothing.
ForecastResult run_simulation(const SingleCandidateContext& ctx, const SimulationParameters& params);

// All candidates walked independently per iteration; the iteration's sample is
// the earliest hire. Iterations without a hire contribute nothing.
// Throws InvalidParameter on negative iterations or rates outside [0,1].
ForecastResult run_pipeline_simulation(const std::vector<PipelineCandidate>& candidates,
                                       const SimulationParameters& params,
                                       Date start_date,
                                       const std::string& seed,
                                       int iterations = kDefaultIterations);

// Same result as run_pipeline_simulation, bit for bit, with RNG blocks spread
// over worker threads. threads <= 0 uses the hardware concurrency.
ForecastResult run_pipeline_simulation_parallel(const std::vector<PipelineCandidate>& candidates,
                                                const SimulationParameters& params,
                                                Date start_date,
                                                const std::string& seed,
                                                int iterations,
                                                int threads);

// Days for one candidate from stage `from` to HIRED, or nullopt if dropped.
// Exposed for tests and for callers that drive their own loop.
std::optional<int> simulate_candidate(Stage from, const SimulationParameters& params, std::mt19937& rng);

// Generator for block `block` of the run seeded by `seed`.
std::mt19937 block_rng(const std::string& seed, std::uint64_t block);

// Nearest-rank percentile (pct in 1..100) over an ascending sample.
int percentile_days(const std::vector<int>& sorted_days, int pct);

// Share of simulated fills on or before target; nullopt for an empty result.
std::optional<double> probability_by_target(const ForecastResult& r, Date start_date, Date target);

} // namespace fillcast
