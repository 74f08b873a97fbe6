#pragma once
#include <optional>
#include <string>
#include <vector>
#include <fillcast/capacity.hpp>
#include <fillcast/forecast.hpp>
#include <fillcast/penalty.hpp>

namespace fillcast {

inline constexpr int kConstrainedP50DeltaDays = 3;
inline constexpr double kConstrainedTotalDelayDays = 5.0;

struct CapacityAwareForecastResult {
  ForecastResult pipeline_only;
  ForecastResult capacity_aware;
  int p50_delta_days = 0; // capacity_aware.p50 - pipeline_only.p50
  std::vector<StageQueueDiagnostic> capacity_bottlenecks;
  std::vector<ConfidenceReason> capacity_reasons;
  Confidence capacity_confidence = Confidence::Low; // never Insufficient
  bool capacity_constrained = false;
  CapacityPenaltyResult penalty;
  std::optional<double> pipeline_probability_by_target;
  std::optional<double> capacity_probability_by_target;
};

// Runs the pipeline simulation twice with the same seed, once with the fitted
// durations and once with every stage extended by its queueing delay. With a
// positive total delay, capacity_aware.p50_date >= pipeline_only.p50_date.
CapacityAwareForecastResult run_capacity_aware_forecast(const std::vector<PipelineCandidate>& candidates,
                                                        const GlobalDemand& global_demand,
                                                        const SimulationParameters& params,
                                                        const CapacityProfile& profile,
                                                        Date start_date,
                                                        const std::string& seed,
                                                        int iterations = kDefaultIterations,
                                                        std::optional<Date> target_date = std::nullopt,
                                                        int threads = 1);

// Everything needed to forecast one requisition from raw records.
struct RequisitionForecastInput {
  std::string req_id;
  OwnerIds owners;
  std::vector<PipelineCandidate> pipeline;
  SimulationParameters params;
  Date start_date{};
  std::string seed;
  int iterations = kDefaultIterations;
  std::optional<Date> target_date;
  int lookback_weeks = kDefaultLookbackWeeks;
  std::vector<Event> events;
  std::vector<Candidate> candidates;
  std::vector<Requisition> requisitions;
  std::vector<User> users;
};

// lookback window -> infer_capacity -> compute_global_demand -> capacity-aware
// forecast. Without a capacity profile both slots hold the pipeline-only
// forecast and the result is not capacity constrained.
CapacityAwareForecastResult forecast_requisition(const RequisitionForecastInput& in);

} // namespace fillcast
