#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <fillcast/duration.hpp>
#include <fillcast/types.hpp>

namespace fillcast {

// Fitted inputs for one simulation call. Owned by the caller.
struct SimulationParameters {
  std::map<Stage, double> conversion_rates;            // probability of advancing
  std::map<Stage, DurationDistribution> durations;     // dwell time per stage
  std::map<std::string, int> sample_sizes;             // "<STAGE>_rate" / "<STAGE>_duration"
};

struct PipelineCandidate {
  std::string candidate_id;
  Stage current_stage = Stage::Screen;
};

// "SCREEN_rate", "SCREEN_duration", ...
std::string rate_key(Stage s);
std::string duration_key(Stage s);

// Sample size recorded under key, if any.
std::optional<int> sample_size(const SimulationParameters& p, const std::string& key);

// Global pass rate and typical dwell for a stage; used when local data is thin.
struct StagePrior {
  Stage stage;
  double pass_rate;   // 0..1
  double median_days; // >= 0
};

// Built-in catalog, one entry per funnel-relevant stage.
const std::vector<StagePrior>& stage_priors();
std::optional<StagePrior> stage_prior(Stage s);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Row: stage,rate,rate_n,kind,arg1,arg2,duration_n
//   kind = constant  (arg1 = days)
//        | lognormal (arg1 = mu, arg2 = sigma)
//        | empirical (arg1 = days:weight|days:weight|...)
// rate_n, duration_n and arg2 may be empty. Accepts an optional header row;
// ignores blank lines and lines starting with '#'. Invalid rows are skipped.
SimulationParameters parameters_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<SimulationParameters> load_parameters_csv(const std::string& path);

} // namespace fillcast
