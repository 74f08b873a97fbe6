#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <fillcast/capacity.hpp>
#include <fillcast/duration.hpp>
#include <fillcast/params.hpp>

namespace fillcast {

inline constexpr double kMaxQueueDelayDays = 21.0;
inline constexpr double kDefaultQueueFactor = 1.0;
inline constexpr double kTargetUtilization = 0.9;
inline constexpr int kMaxTopBottlenecks = 3;
inline constexpr int kReassignOpenReqThreshold = 3;

// Stages whose throughput is limited by a person.
inline constexpr std::array<Stage, 4> kCapacityLimitedStages{
  Stage::Screen, Stage::HmScreen, Stage::Onsite, Stage::Offer
};

using PipelineByStage = std::map<Stage, int>;

enum class OwnerType : int { None, Recruiter, Hm };
const char* to_string(OwnerType o);

enum class DemandScope : int { SingleReq, GlobalByRecruiter, GlobalByHm };
const char* to_string(DemandScope s);

// "Screen", "HM Interview", ...
const char* stage_label(Stage s);

struct OwnerContext {
  std::string id;
  std::optional<std::string> name;
  int open_req_count = 0;
  int candidates_in_flight = 0;
  std::vector<std::string> req_ids;
};

// Workload competing for the owners' attention across all their open reqs.
struct GlobalDemand {
  DemandScope scope = DemandScope::SingleReq;
  PipelineByStage recruiter_demand; // SCREEN / ONSITE / OFFER
  PipelineByStage hm_demand;        // HM_SCREEN
  PipelineByStage selected_req_pipeline;
  OwnerContext recruiter_context;
  OwnerContext hm_context;
  Confidence confidence = Confidence::Medium;
  std::vector<ConfidenceReason> confidence_reasons;

  int selected_pipeline_total() const;
};

GlobalDemand compute_global_demand(const std::string& selected_req_id,
                                   const OwnerIds& owners,
                                   const std::vector<Candidate>& candidates,
                                   const std::vector<Requisition>& requisitions,
                                   const std::vector<User>& users);

// Backlog-to-delay policy: ((demand - rate) / rate) * 7 * factor days,
// capped at kMaxQueueDelayDays. Zero unless demand > rate > 0.
double queue_delay_days(double demand, double service_rate, double factor = kDefaultQueueFactor);

// Weekly throughput serving `stage`, falling back to the cohort defaults.
double service_rate_for_stage(Stage stage, const CapacityProfile& profile);

struct StageQueueDiagnostic {
  Stage stage = Stage::Screen;
  std::string stage_name;
  int demand = 0;
  double service_rate = 0.0;
  double queue_delay_days = 0.0;
  bool is_bottleneck = false;
  OwnerType owner = OwnerType::None;
  Confidence confidence = Confidence::Low;
};

struct AdjustedDuration {
  Stage stage = Stage::Screen;
  double original_median_days = kDefaultStageDays;
  double queue_delay_days = 0.0;
  double adjusted_median_days = kDefaultStageDays;
  DurationDistribution adjusted; // original shifted by the delay
};

enum class RecommendationType : int { IncreaseThroughput, ReassignWorkload, ImproveData };

struct Recommendation {
  RecommendationType type = RecommendationType::ImproveData;
  std::string description;
  int estimated_impact_days = 0;
  std::optional<Stage> stage;
  double current_value = 0.0;
  double target_value = 0.0;
  OwnerType owner = OwnerType::None;
};

struct CapacityPenaltyResult {
  std::map<Stage, AdjustedDuration> adjusted_durations;
  std::vector<StageQueueDiagnostic> stage_diagnostics; // kCapacityLimitedStages order
  std::vector<StageQueueDiagnostic> top_bottlenecks;   // by delay, descending
  double total_queue_delay_days = 0.0;
  Confidence confidence = Confidence::Low;
  std::vector<Recommendation> recommendations;         // global-demand variant only
  std::optional<GlobalDemand> global_demand;
};

// Penalty against the owners' global workload. Per stage the demand is the
// larger of recruiter and HM demand; the owner is the side carrying it.
CapacityPenaltyResult apply_capacity_penalty_v11(const std::map<Stage, DurationDistribution>& durations,
                                                 const GlobalDemand& demand,
                                                 const CapacityProfile& profile);

// Single-requisition variant: demand is the requisition's own pipeline.
CapacityPenaltyResult apply_capacity_penalty(const std::map<Stage, DurationDistribution>& durations,
                                             const PipelineByStage& pipeline_by_stage,
                                             const CapacityProfile& profile);

// Copy of params with every delayed stage's duration shifted by its delay.
SimulationParameters capacity_adjusted_parameters(const SimulationParameters& params,
                                                  const CapacityPenaltyResult& penalty);

} // namespace fillcast
