#include <fillcast/capacity.hpp>
#include <fillcast/log.hpp>
#include <fillcast/shrinkage.hpp>
#include <algorithm>
#include <set>

namespace fillcast {

DateRange lookback_window(Date start, int weeks) {
  return DateRange{add_days(start, -7 * std::max(0, weeks)), start};
}

int weeks_in(const DateRange& r) {
  return std::max(1, days_between(r.start, r.end) / 7);
}

bool is_open(const Requisition& r) {
  return r.status == ReqStatus::Open || (!r.closed_at && r.status != ReqStatus::Closed);
}

bool is_active(const Candidate& c) {
  return !c.disposition || *c.disposition == Disposition::Active;
}

static inline bool in_window(const Event& e, const DateRange& r) {
  return e.at >= r.start && e.at <= r.end;
}

static std::vector<Event> events_for_reqs(const std::vector<Event>& events,
                                          const std::set<std::string>& reqs,
                                          const DateRange& r) {
  std::vector<Event> out;
  for (const auto& e : events) {
    if (in_window(e, r) && reqs.count(e.req_id)) out.push_back(e);
  }
  return out;
}

static std::optional<std::string> user_name(const std::vector<User>& users, const std::string& id) {
  auto it = std::find_if(users.begin(), users.end(), [&](const User& u){ return u.user_id == id; });
  if (it == users.end() || it->name.empty()) return std::nullopt;
  return it->name;
}

int count_stage_transitions(const std::vector<Event>& events, Stage stage) {
  return static_cast<int>(std::count_if(events.begin(), events.end(), [&](const Event& e) {
    return e.type == EventType::StageChange && e.to_stage == stage;
  }));
}

CohortDefaults calculate_cohort_defaults(const std::vector<Event>& events, const DateRange& window) {
  std::vector<Event> in;
  std::set<std::string> actors;
  for (const auto& e : events) {
    if (!in_window(e, window)) continue;
    in.push_back(e);
    if (!e.actor_user_id.empty()) actors.insert(e.actor_user_id);
  }

  CohortDefaults d;
  d.weeks = weeks_in(window);
  d.recruiters = std::max<int>(1, static_cast<int>(actors.size()));
  d.hms = d.recruiters / 2;

  // Per person per week. Recruiters share screens/onsites/offers roughly two
  // per req team, HM screens roughly three.
  auto per_person = [&](Stage s, double share, double prior) {
    const int n = count_stage_transitions(in, s);
    if (n == 0) return prior;
    return double(n) / d.weeks / std::max(1.0, d.recruiters / share);
  };

  d.screens_per_week = std::max(1.0, per_person(Stage::Screen, 2.0, GlobalCapacityPriors::screens_per_week));
  d.hm_screens_per_week = std::max(0.5, per_person(Stage::HmScreen, 3.0, GlobalCapacityPriors::hm_screens_per_week));
  d.onsites_per_week = std::max(0.5, per_person(Stage::Onsite, 2.0, GlobalCapacityPriors::onsites_per_week));
  d.offers_per_week = std::max(0.25, per_person(Stage::Offer, 2.0, GlobalCapacityPriors::offers_per_week));
  d.hm_feedback_hours = GlobalCapacityPriors::hm_feedback_hours;
  return d;
}

StageCapacity build_stage_capacity(Stage stage, int transitions, int weeks, double prior_throughput) {
  weeks = std::max(1, weeks);
  StageCapacity c;
  c.stage = stage;
  c.n_weeks = weeks;
  c.n_transitions = transitions;
  c.prior_throughput = prior_throughput;
  c.observed_throughput = double(transitions) / weeks;
  c.throughput_per_week = std::max(kMinThroughputPerWeek,
      shrink_rate(c.observed_throughput, prior_throughput, weeks, kCapacityPriorWeeks));

  if (weeks >= kHighConfidenceWeeks && transitions >= kHighConfidenceTransitions) {
    c.confidence = Confidence::High;
  } else if (weeks >= kMediumConfidenceWeeks && transitions >= kMediumConfidenceTransitions) {
    c.confidence = Confidence::Medium;
  } else {
    c.confidence = Confidence::Low;
  }
  return c;
}

static std::vector<ConfidenceReason> recruiter_reasons(int transitions, int weeks, Confidence c) {
  std::vector<ConfidenceReason> out;
  const auto w = std::to_string(weeks);
  if (weeks >= kHighConfidenceWeeks) {
    out.push_back({ReasonKind::SampleSize, w + " weeks of history analyzed", Impact::Positive});
  } else if (weeks >= kMediumConfidenceWeeks) {
    out.push_back({ReasonKind::SampleSize, w + " weeks of history (moderate sample)", Impact::Neutral});
  } else {
    out.push_back({ReasonKind::SampleSize, "Only " + w + " weeks of history (limited)", Impact::Negative});
  }
  if (transitions < kMinTransitionsForThroughput) {
    out.push_back({ReasonKind::MissingData,
                   "Few stage transitions observed (" + std::to_string(transitions) + ")",
                   Impact::Negative});
  }
  if (c <= Confidence::Low) {
    out.push_back({ReasonKind::Shrinkage, "Estimates rely heavily on cohort priors", Impact::Negative});
  }
  return out;
}

static std::vector<ConfidenceReason> hm_reasons(int transitions) {
  const auto t = std::to_string(transitions);
  if (transitions >= kHighConfidenceTransitions) {
    return {{ReasonKind::SampleSize, t + " HM interactions observed", Impact::Positive}};
  }
  if (transitions >= kMediumConfidenceTransitions) {
    return {{ReasonKind::SampleSize, t + " HM interactions (moderate)", Impact::Neutral}};
  }
  return {{ReasonKind::SampleSize, "Few HM interactions (" + t + ")", Impact::Negative}};
}

static std::optional<RecruiterCapacity> infer_recruiter(const std::string& id,
                                                        const DateRange& window,
                                                        const std::vector<Event>& events,
                                                        const std::vector<Requisition>& reqs,
                                                        const std::vector<User>& users,
                                                        const CohortDefaults& cohort) {
  if (id.empty()) return std::nullopt;
  std::set<std::string> owned;
  for (const auto& r : reqs) {
    if (r.recruiter_id == id) owned.insert(r.req_id);
  }
  if (owned.empty()) return std::nullopt;

  const auto mine = events_for_reqs(events, owned, window);
  const int weeks = weeks_in(window);

  const int screens = count_stage_transitions(mine, Stage::Screen);
  const int hm_screens = count_stage_transitions(mine, Stage::HmScreen);
  const int onsites = count_stage_transitions(mine, Stage::Onsite);
  const int offers = count_stage_transitions(mine, Stage::Offer);

  RecruiterCapacity rc;
  rc.recruiter_id = id;
  rc.recruiter_name = user_name(users, id);
  rc.window = window;
  rc.weeks_analyzed = weeks;
  rc.screens_per_week = build_stage_capacity(Stage::Screen, screens, weeks, cohort.screens_per_week);
  const auto hm_cap = build_stage_capacity(Stage::HmScreen, hm_screens, weeks, cohort.hm_screens_per_week);
  const auto onsite_cap = build_stage_capacity(Stage::Onsite, onsites, weeks, cohort.onsites_per_week);
  const auto offer_cap = build_stage_capacity(Stage::Offer, offers, weeks, cohort.offers_per_week);
  if (hm_screens > 0) rc.hm_screens_per_week = hm_cap;
  if (onsites > 0) rc.onsites_per_week = onsite_cap;
  if (offers > 0) rc.offers_per_week = offer_cap;

  rc.overall_confidence = min_confidence(rc.screens_per_week.confidence,
                                         min_confidence(hm_cap.confidence, onsite_cap.confidence));
  rc.confidence_reasons = recruiter_reasons(screens, weeks, rc.screens_per_week.confidence);
  return rc;
}

static std::optional<HmCapacity> infer_hm(const std::string& id,
                                          const DateRange& window,
                                          const std::vector<Event>& events,
                                          const std::vector<Requisition>& reqs,
                                          const std::vector<User>& users,
                                          const CohortDefaults& cohort) {
  if (id.empty()) return std::nullopt;
  std::set<std::string> owned;
  for (const auto& r : reqs) {
    if (r.hiring_manager_id == id) owned.insert(r.req_id);
  }
  if (owned.empty()) return std::nullopt;

  const auto mine = events_for_reqs(events, owned, window);
  const int weeks = weeks_in(window);
  const int interviews = count_stage_transitions(mine, Stage::HmScreen);
  const int feedback = static_cast<int>(std::count_if(mine.begin(), mine.end(), [&](const Event& e) {
    return e.type == EventType::FeedbackSubmitted && e.actor_user_id == id;
  }));

  HmCapacity hc;
  hc.hm_id = id;
  hc.hm_name = user_name(users, id);
  hc.window = window;
  hc.weeks_analyzed = weeks;

  // Turnaround is a cohort proxy until interview/feedback pairs are available.
  if (feedback >= kMinTransitionsForThroughput) {
    hc.feedback_turnaround = FeedbackTurnaround{
      cohort.hm_feedback_hours,
      cohort.hm_feedback_hours * 1.5,
      feedback,
      feedback >= kHighConfidenceTransitions ? Confidence::High : Confidence::Medium
    };
  }

  const auto cap = build_stage_capacity(Stage::HmScreen, interviews, weeks, cohort.hm_screens_per_week);
  if (interviews > 0) hc.interviews_per_week = cap;
  hc.overall_confidence = cap.confidence;
  hc.confidence_reasons = hm_reasons(interviews);
  return hc;
}

std::optional<CapacityProfile> infer_capacity(const OwnerIds& owners,
                                              const DateRange& window,
                                              const std::vector<Event>& events,
                                              const std::vector<Candidate>& /*candidates*/,
                                              const std::vector<Requisition>& requisitions,
                                              const std::vector<User>& users) {
  if (events.empty()) {
    log_info("capacity: no events, capacity profile unavailable");
    return std::nullopt;
  }
  if (owners.recruiter_id.empty() && owners.hm_id.empty()) {
    log_info("capacity: no recruiter or HM id, capacity profile unavailable");
    return std::nullopt;
  }

  CapacityProfile p;
  p.cohort_defaults = calculate_cohort_defaults(events, window);
  p.recruiter = infer_recruiter(owners.recruiter_id, window, events, requisitions, users, p.cohort_defaults);
  p.hm = infer_hm(owners.hm_id, window, events, requisitions, users, p.cohort_defaults);

  const Confidence rc = p.recruiter ? p.recruiter->overall_confidence : Confidence::Low;
  const Confidence hc = p.hm ? p.hm->overall_confidence : Confidence::Low;
  p.overall_confidence = min_confidence(rc, hc);
  p.used_cohort_fallback = !p.recruiter || !p.hm;

  if (p.recruiter) {
    p.confidence_reasons.insert(p.confidence_reasons.end(),
                                p.recruiter->confidence_reasons.begin(), p.recruiter->confidence_reasons.end());
  }
  if (p.hm) {
    p.confidence_reasons.insert(p.confidence_reasons.end(),
                                p.hm->confidence_reasons.begin(), p.hm->confidence_reasons.end());
  }
  if (p.used_cohort_fallback) {
    p.confidence_reasons.push_back({ReasonKind::MissingData,
                                    "Using cohort defaults for some capacity estimates",
                                    Impact::Negative});
  }

  log_debug("capacity: recruiter=" + owners.recruiter_id + " hm=" + owners.hm_id +
            " confidence " + to_string(p.overall_confidence));
  return p;
}

} // namespace fillcast
