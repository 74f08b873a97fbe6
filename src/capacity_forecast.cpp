#include <fillcast/capacity_forecast.hpp>
#include <fillcast/log.hpp>

namespace fillcast {

static inline Confidence reportable(Confidence c) {
  return c == Confidence::Insufficient ? Confidence::Low : c;
}

CapacityAwareForecastResult run_capacity_aware_forecast(const std::vector<PipelineCandidate>& candidates,
                                                        const GlobalDemand& global_demand,
                                                        const SimulationParameters& params,
                                                        const CapacityProfile& profile,
                                                        Date start_date,
                                                        const std::string& seed,
                                                        int iterations,
                                                        std::optional<Date> target_date,
                                                        int threads) {
  CapacityAwareForecastResult r;
  r.pipeline_only = run_pipeline_simulation_parallel(candidates, params, start_date, seed, iterations, threads);

  r.penalty = apply_capacity_penalty_v11(params.durations, global_demand, profile);
  const SimulationParameters adjusted = capacity_adjusted_parameters(params, r.penalty);

  // Same seed: both runs see the same uniforms, so only the delays differ.
  r.capacity_aware = run_pipeline_simulation_parallel(candidates, adjusted, start_date, seed, iterations, threads);

  r.p50_delta_days = days_between(r.pipeline_only.p50_date, r.capacity_aware.p50_date);
  r.capacity_bottlenecks = r.penalty.top_bottlenecks;
  r.capacity_reasons = profile.confidence_reasons;
  r.capacity_confidence = reportable(r.penalty.confidence);
  r.capacity_constrained = r.p50_delta_days >= kConstrainedP50DeltaDays ||
                           r.penalty.total_queue_delay_days >= kConstrainedTotalDelayDays;

  if (target_date) {
    r.pipeline_probability_by_target = probability_by_target(r.pipeline_only, start_date, *target_date);
    r.capacity_probability_by_target = probability_by_target(r.capacity_aware, start_date, *target_date);
  }

  log_debug("capacity-aware forecast seed=" + seed + ": p50 delta " + std::to_string(r.p50_delta_days) +
            " days, constrained=" + (r.capacity_constrained ? "yes" : "no"));
  return r;
}

CapacityAwareForecastResult forecast_requisition(const RequisitionForecastInput& in) {
  const DateRange window = lookback_window(in.start_date, in.lookback_weeks);
  const auto profile = infer_capacity(in.owners, window, in.events, in.candidates,
                                      in.requisitions, in.users);
  if (!profile) {
    CapacityAwareForecastResult r;
    r.pipeline_only = run_pipeline_simulation(in.pipeline, in.params, in.start_date, in.seed, in.iterations);
    r.capacity_aware = r.pipeline_only;
    r.capacity_confidence = Confidence::Low;
    r.capacity_reasons.push_back({ReasonKind::MissingData,
                                  "Capacity data unavailable - showing pipeline-only forecast",
                                  Impact::Negative});
    if (in.target_date) {
      r.pipeline_probability_by_target = probability_by_target(r.pipeline_only, in.start_date, *in.target_date);
      r.capacity_probability_by_target = r.pipeline_probability_by_target;
    }
    return r;
  }

  const GlobalDemand demand = compute_global_demand(in.req_id, in.owners, in.candidates,
                                                    in.requisitions, in.users);
  return run_capacity_aware_forecast(in.pipeline, demand, in.params, *profile, in.start_date,
                                     in.seed, in.iterations, in.target_date);
}

} // namespace fillcast
