#pragma once
#include <optional>
#include <string>
#include <vector>
#include <fillcast/types.hpp>

namespace fillcast {

// ---- Raw inputs (from the data-import layer) ----

enum class EventType : int { StageChange, FeedbackSubmitted, Other };

struct Event {
  std::string candidate_id;
  std::string req_id;
  EventType type = EventType::Other;
  std::optional<Stage> to_stage; // StageChange only
  std::string actor_user_id;
  Date at{};
};

enum class Disposition : int { Active, Rejected, Withdrawn, Hired };

struct Candidate {
  std::string candidate_id;
  std::string req_id;
  Stage current_stage = Stage::Applied;
  std::optional<Disposition> disposition; // unset counts as active
};

enum class ReqStatus : int { Open, OnHold, Closed, Cancelled };

struct Requisition {
  std::string req_id;
  std::string recruiter_id;
  std::string hiring_manager_id;
  ReqStatus status = ReqStatus::Open;
  std::optional<Date> closed_at;
};

struct User {
  std::string user_id;
  std::string name;
};

// Either id may be empty.
struct OwnerIds {
  std::string recruiter_id;
  std::string hm_id;
};

// Inclusive on both ends.
struct DateRange {
  Date start{};
  Date end{};
};

inline constexpr int kDefaultLookbackWeeks = 12;

// [start - 7*weeks days, start]
DateRange lookback_window(Date start, int weeks = kDefaultLookbackWeeks);

// max(1, whole weeks in the range)
int weeks_in(const DateRange& r);

bool is_open(const Requisition& r);
bool is_active(const Candidate& c);

// ---- Tuning ----

inline constexpr int kCapacityPriorWeeks = 4;       // shrinkage prior weight
inline constexpr int kMinTransitionsForThroughput = 5;
inline constexpr int kHighConfidenceWeeks = 8;
inline constexpr int kHighConfidenceTransitions = 15;
inline constexpr int kMediumConfidenceWeeks = 4;
inline constexpr int kMediumConfidenceTransitions = 5;
inline constexpr double kMinThroughputPerWeek = 0.1;

// Org-wide fallbacks when nothing was observed.
struct GlobalCapacityPriors {
  static constexpr double screens_per_week = 8.0;
  static constexpr double hm_screens_per_week = 4.0;
  static constexpr double onsites_per_week = 3.0;
  static constexpr double offers_per_week = 1.5;
  static constexpr double hm_feedback_hours = 48.0;
};

// ---- Outputs ----

enum class ReasonKind : int { SampleSize, MissingData, Shrinkage };
enum class Impact : int { Positive, Neutral, Negative };

struct ConfidenceReason {
  ReasonKind kind = ReasonKind::SampleSize;
  std::string message;
  Impact impact = Impact::Neutral;
};

struct StageCapacity {
  Stage stage = Stage::Screen;
  double throughput_per_week = 0.0; // shrunk, floored at kMinThroughputPerWeek
  int n_weeks = 0;
  int n_transitions = 0;
  Confidence confidence = Confidence::Low;
  double prior_throughput = 0.0;
  double observed_throughput = 0.0;
};

struct RecruiterCapacity {
  std::string recruiter_id;
  std::optional<std::string> recruiter_name;
  StageCapacity screens_per_week;
  std::optional<StageCapacity> hm_screens_per_week; // only when observed
  std::optional<StageCapacity> onsites_per_week;
  std::optional<StageCapacity> offers_per_week;
  Confidence overall_confidence = Confidence::Low;
  std::vector<ConfidenceReason> confidence_reasons;
  DateRange window;
  int weeks_analyzed = 1;
};

struct FeedbackTurnaround {
  double median_hours = 0.0;
  double p75_hours = 0.0;
  int n = 0;
  Confidence confidence = Confidence::Low;
};

struct HmCapacity {
  std::string hm_id;
  std::optional<std::string> hm_name;
  std::optional<FeedbackTurnaround> feedback_turnaround;
  std::optional<StageCapacity> interviews_per_week; // only when observed
  Confidence overall_confidence = Confidence::Low;
  std::vector<ConfidenceReason> confidence_reasons;
  DateRange window;
  int weeks_analyzed = 1;
};

// Per-person weekly throughput across everyone active in the window.
struct CohortDefaults {
  double screens_per_week = GlobalCapacityPriors::screens_per_week;
  double hm_screens_per_week = GlobalCapacityPriors::hm_screens_per_week;
  double onsites_per_week = GlobalCapacityPriors::onsites_per_week;
  double offers_per_week = GlobalCapacityPriors::offers_per_week;
  double hm_feedback_hours = GlobalCapacityPriors::hm_feedback_hours;
  int recruiters = 1;
  int hms = 0;
  int weeks = 1;
};

struct CapacityProfile {
  std::optional<RecruiterCapacity> recruiter;
  std::optional<HmCapacity> hm;
  CohortDefaults cohort_defaults;
  Confidence overall_confidence = Confidence::Low;
  std::vector<ConfidenceReason> confidence_reasons;
  bool used_cohort_fallback = true;
};

// Stage-change events into `stage`.
int count_stage_transitions(const std::vector<Event>& events, Stage stage);

CohortDefaults calculate_cohort_defaults(const std::vector<Event>& events, const DateRange& window);

// Observed transitions/weeks shrunk toward prior_throughput with weeks as n.
StageCapacity build_stage_capacity(Stage stage, int transitions, int weeks, double prior_throughput);

// Throughput profile of the owners over the window. nullopt (unavailable)
// when there are no events or no owner id at all.
std::optional<CapacityProfile> infer_capacity(const OwnerIds& owners,
                                              const DateRange& window,
                                              const std::vector<Event>& events,
                                              const std::vector<Candidate>& candidates,
                                              const std::vector<Requisition>& requisitions,
                                              const std::vector<User>& users);

} // namespace fillcast
