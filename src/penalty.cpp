#include <fillcast/penalty.hpp>
#include <fillcast/errors.hpp>
#include <fillcast/log.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace fillcast {

const char* to_string(OwnerType o) {
  switch (o) {
    case OwnerType::None:      return "none";
    case OwnerType::Recruiter: return "recruiter";
    case OwnerType::Hm:        return "hm";
  }
  return "none";
}

const char* to_string(DemandScope s) {
  switch (s) {
    case DemandScope::SingleReq:         return "single_req";
    case DemandScope::GlobalByRecruiter: return "global_by_recruiter";
    case DemandScope::GlobalByHm:        return "global_by_hm";
  }
  return "single_req";
}

const char* stage_label(Stage s) {
  switch (s) {
    case Stage::Screen:   return "Screen";
    case Stage::HmScreen: return "HM Interview";
    case Stage::Onsite:   return "Onsite";
    case Stage::Offer:    return "Offer";
    default:              return to_string(s);
  }
}

int GlobalDemand::selected_pipeline_total() const {
  int total = 0;
  for (const auto& [stage, n] : selected_req_pipeline) total += n;
  return total;
}

static int demand_at(const PipelineByStage& p, Stage s) {
  auto it = p.find(s);
  return it == p.end() ? 0 : it->second;
}

GlobalDemand compute_global_demand(const std::string& selected_req_id,
                                   const OwnerIds& owners,
                                   const std::vector<Candidate>& candidates,
                                   const std::vector<Requisition>& requisitions,
                                   const std::vector<User>& users) {
  GlobalDemand g;
  const bool has_recruiter = !owners.recruiter_id.empty();
  const bool has_hm = !owners.hm_id.empty();

  std::set<std::string> recruiter_reqs, hm_reqs;
  for (const auto& r : requisitions) {
    if (!is_open(r)) continue;
    if (has_recruiter && r.recruiter_id == owners.recruiter_id) {
      recruiter_reqs.insert(r.req_id);
      g.recruiter_context.req_ids.push_back(r.req_id);
    }
    if (has_hm && r.hiring_manager_id == owners.hm_id) {
      hm_reqs.insert(r.req_id);
      g.hm_context.req_ids.push_back(r.req_id);
    }
  }

  for (const auto& c : candidates) {
    if (!is_active(c)) continue;
    const Stage s = c.current_stage;
    if (recruiter_reqs.count(c.req_id)) {
      ++g.recruiter_context.candidates_in_flight;
      if (s == Stage::Screen || s == Stage::Onsite || s == Stage::Offer) ++g.recruiter_demand[s];
    }
    if (hm_reqs.count(c.req_id)) {
      ++g.hm_context.candidates_in_flight;
      if (s == Stage::HmScreen) ++g.hm_demand[s];
    }
    if (c.req_id == selected_req_id) ++g.selected_req_pipeline[s];
  }

  auto name_of = [&](const std::string& id) -> std::optional<std::string> {
    if (id.empty()) return std::nullopt;
    auto it = std::find_if(users.begin(), users.end(), [&](const User& u){ return u.user_id == id; });
    if (it == users.end() || it->name.empty()) return std::nullopt;
    return it->name;
  };
  g.recruiter_context.id = owners.recruiter_id;
  g.recruiter_context.name = name_of(owners.recruiter_id);
  g.recruiter_context.open_req_count = static_cast<int>(recruiter_reqs.size());
  g.hm_context.id = owners.hm_id;
  g.hm_context.name = name_of(owners.hm_id);
  g.hm_context.open_req_count = static_cast<int>(hm_reqs.size());

  if (!has_recruiter && !has_hm) {
    g.scope = DemandScope::SingleReq;
    g.confidence = Confidence::Low;
    g.confidence_reasons.push_back({ReasonKind::MissingData,
        "Both recruiter_id and hm_id missing - using single-req fallback", Impact::Negative});
  } else if (has_recruiter && has_hm) {
    g.scope = DemandScope::GlobalByRecruiter;
    g.confidence = Confidence::High;
    if (recruiter_reqs.size() > 1) {
      g.confidence_reasons.push_back({ReasonKind::SampleSize,
          "Using global workload: Recruiter has " + std::to_string(recruiter_reqs.size()) + " open reqs",
          Impact::Positive});
    }
  } else if (has_recruiter) {
    g.scope = DemandScope::GlobalByRecruiter;
    g.confidence = Confidence::Medium;
    g.confidence_reasons.push_back({ReasonKind::MissingData,
        "hm_id missing - HM demand using cohort defaults", Impact::Neutral});
  } else {
    g.scope = DemandScope::GlobalByHm;
    g.confidence = Confidence::Medium;
    g.confidence_reasons.push_back({ReasonKind::MissingData,
        "recruiter_id missing - Recruiter demand using cohort defaults", Impact::Neutral});
  }

  if (g.selected_pipeline_total() == 0) {
    g.confidence = Confidence::Low;
    g.confidence_reasons.push_back({ReasonKind::SampleSize,
        "Selected req has 0 active candidates in pipeline", Impact::Negative});
  }
  return g;
}

double queue_delay_days(double demand, double service_rate, double factor) {
  if (!std::isfinite(demand) || !std::isfinite(service_rate) || !std::isfinite(factor) || factor < 0.0) {
    throw InvalidParameter("queue_delay_days: demand, rate and factor must be finite, factor >= 0");
  }
  if (service_rate <= 0.0 || demand <= service_rate) return 0.0;
  const double raw = (demand - service_rate) / service_rate * 7.0 * factor;
  return std::min(raw, kMaxQueueDelayDays);
}

double service_rate_for_stage(Stage stage, const CapacityProfile& profile) {
  const auto& rc = profile.recruiter;
  const auto& hm = profile.hm;
  const auto& cohort = profile.cohort_defaults;
  switch (stage) {
    case Stage::Screen:
      return rc ? rc->screens_per_week.throughput_per_week : cohort.screens_per_week;
    case Stage::HmScreen:
      if (hm && hm->interviews_per_week) return hm->interviews_per_week->throughput_per_week;
      if (rc && rc->hm_screens_per_week) return rc->hm_screens_per_week->throughput_per_week;
      return cohort.hm_screens_per_week;
    case Stage::Onsite:
      return rc && rc->onsites_per_week ? rc->onsites_per_week->throughput_per_week : cohort.onsites_per_week;
    case Stage::Offer:
      return rc && rc->offers_per_week ? rc->offers_per_week->throughput_per_week : cohort.offers_per_week;
    default:
      return 5.0;
  }
}

namespace {

// Side that carries the stage's demand; ties go to the stage's primary owner.
OwnerType demand_owner(Stage s, int recruiter_demand, int hm_demand) {
  if (recruiter_demand > hm_demand) return OwnerType::Recruiter;
  if (hm_demand > recruiter_demand) return OwnerType::Hm;
  return s == Stage::HmScreen ? OwnerType::Hm : OwnerType::Recruiter;
}

// Observed capacity backing the stage, or nullopt when it is a cohort prior.
std::optional<Confidence> observed_confidence(Stage s, const CapacityProfile& p) {
  const auto& rc = p.recruiter;
  const auto& hm = p.hm;
  switch (s) {
    case Stage::Screen:
      if (rc) return rc->screens_per_week.confidence;
      break;
    case Stage::HmScreen:
      if (hm && hm->interviews_per_week) return hm->interviews_per_week->confidence;
      if (rc && rc->hm_screens_per_week) return rc->hm_screens_per_week->confidence;
      break;
    case Stage::Onsite:
      if (rc && rc->onsites_per_week) return rc->onsites_per_week->confidence;
      break;
    case Stage::Offer:
      if (rc && rc->offers_per_week) return rc->offers_per_week->confidence;
      break;
    default:
      break;
  }
  return std::nullopt;
}

Confidence stage_confidence(Stage s, const CapacityProfile& p) {
  return observed_confidence(s, p).value_or(Confidence::Low);
}

// Stricter: priors or a missing owner id for the stage give LOW.
Confidence stage_confidence_v11(Stage s, OwnerType owner, const CapacityProfile& p, const GlobalDemand& g) {
  const auto c = observed_confidence(s, p);
  if (!c) return Confidence::Low;
  if (owner == OwnerType::Recruiter && g.recruiter_context.id.empty()) return Confidence::Low;
  if (owner == OwnerType::Hm && g.hm_context.id.empty()) return Confidence::Low;
  return *c;
}

AdjustedDuration adjust_duration(Stage s, const std::map<Stage, DurationDistribution>& durations, double delay) {
  AdjustedDuration a;
  a.stage = s;
  a.queue_delay_days = delay;
  auto it = durations.find(s);
  const DurationDistribution base = it != durations.end()
      ? it->second : DurationDistribution{ConstantDuration{kDefaultStageDays}};
  a.original_median_days = median_days(base);
  a.adjusted = shift_duration(base, delay);
  a.adjusted_median_days = a.original_median_days + delay;
  return a;
}

std::vector<StageQueueDiagnostic> top_bottlenecks(const std::vector<StageQueueDiagnostic>& diags) {
  std::vector<StageQueueDiagnostic> out;
  for (const auto& d : diags) {
    if (d.is_bottleneck) out.push_back(d);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.queue_delay_days > b.queue_delay_days;
  });
  if (out.size() > static_cast<std::size_t>(kMaxTopBottlenecks)) out.resize(kMaxTopBottlenecks);
  return out;
}

Confidence aggregate_v11(const std::vector<StageQueueDiagnostic>& diags,
                         const CapacityProfile& p, const GlobalDemand& g) {
  int prior_count = 0;
  if (p.used_cohort_fallback) prior_count += 2;
  if (!p.recruiter) prior_count += 2;
  if (!p.hm) prior_count += 1;
  if (prior_count >= 2) return Confidence::Low;
  if (g.recruiter_context.id.empty() && g.hm_context.id.empty()) return Confidence::Low;
  if (g.selected_pipeline_total() == 0) return Confidence::Low;

  Confidence c = g.confidence;
  for (const auto& d : diags) c = min_confidence(c, d.confidence);
  return c;
}

const char* hedge(Confidence c) {
  switch (c) {
    case Confidence::High:   return "Based on observed patterns";
    case Confidence::Medium: return "Based on similar cohorts";
    default:                 return "Estimated (limited data)";
  }
}

std::vector<Recommendation> recommend(const std::vector<StageQueueDiagnostic>& bottlenecks,
                                      const GlobalDemand& g, const CapacityProfile& p) {
  std::vector<Recommendation> out;
  const std::string prefix = std::string(hedge(p.overall_confidence)) + ": ";

  const std::size_t n = std::min<std::size_t>(2, bottlenecks.size());
  for (std::size_t i = 0; i < n; ++i) {
    const auto& b = bottlenecks[i];

    const int target = static_cast<int>(std::ceil(b.demand / kTargetUtilization));
    if (target > b.service_rate) {
      std::ostringstream desc;
      desc << prefix << "Increase " << stage_label(b.stage) << " throughput to ~" << target << "/week";
      out.push_back({RecommendationType::IncreaseThroughput, desc.str(),
                     static_cast<int>(std::lround(b.queue_delay_days * 0.7)),
                     b.stage, b.service_rate, double(target), b.owner});
    }

    const auto& ctx = b.owner == OwnerType::Hm ? g.hm_context : g.recruiter_context;
    if (ctx.open_req_count > kReassignOpenReqThreshold && b.demand > 0) {
      const double per_req = double(b.demand) / ctx.open_req_count;
      const int reassign = static_cast<int>(std::ceil((b.demand - b.service_rate) / per_req));
      if (reassign > 0 && reassign < ctx.open_req_count) {
        out.push_back({RecommendationType::ReassignWorkload,
                       prefix + "Reassign ~" + std::to_string(reassign) + " req(s) to reduce " +
                           (b.owner == OwnerType::Hm ? "HM" : "Recruiter") + " load",
                       static_cast<int>(std::lround(b.queue_delay_days * 0.5)),
                       b.stage, double(ctx.open_req_count), double(ctx.open_req_count - reassign), b.owner});
      }
    }
  }

  if (g.confidence == Confidence::Low) {
    out.push_back({RecommendationType::ImproveData,
                   "Add recruiter_id and hm_id to improve forecast accuracy", 0,
                   std::nullopt, 0.0, 0.0, OwnerType::None});
  }
  return out;
}

} // namespace

CapacityPenaltyResult apply_capacity_penalty_v11(const std::map<Stage, DurationDistribution>& durations,
                                                 const GlobalDemand& demand,
                                                 const CapacityProfile& profile) {
  CapacityPenaltyResult r;
  for (Stage s : kCapacityLimitedStages) {
    const int rd = demand_at(demand.recruiter_demand, s);
    const int hd = demand_at(demand.hm_demand, s);
    const int d = std::max(rd, hd);
    const double rate = service_rate_for_stage(s, profile);
    const double delay = queue_delay_days(d, rate);
    const OwnerType owner = demand_owner(s, rd, hd);

    StageQueueDiagnostic diag;
    diag.stage = s;
    diag.stage_name = stage_label(s);
    diag.demand = d;
    diag.service_rate = rate;
    diag.queue_delay_days = delay;
    diag.is_bottleneck = delay > 0.0;
    diag.owner = diag.is_bottleneck ? owner : OwnerType::None;
    diag.confidence = stage_confidence_v11(s, owner, profile, demand);
    r.stage_diagnostics.push_back(diag);

    r.adjusted_durations.emplace(s, adjust_duration(s, durations, delay));
    r.total_queue_delay_days += delay;
  }

  r.top_bottlenecks = top_bottlenecks(r.stage_diagnostics);
  r.confidence = aggregate_v11(r.stage_diagnostics, profile, demand);
  r.recommendations = recommend(r.top_bottlenecks, demand, profile);
  r.global_demand = demand;

  if (r.total_queue_delay_days > 0.0) {
    log_debug("penalty: total queue delay " + std::to_string(r.total_queue_delay_days) + " days");
  }
  return r;
}

CapacityPenaltyResult apply_capacity_penalty(const std::map<Stage, DurationDistribution>& durations,
                                             const PipelineByStage& pipeline_by_stage,
                                             const CapacityProfile& profile) {
  CapacityPenaltyResult r;
  Confidence c = Confidence::High;
  for (Stage s : kCapacityLimitedStages) {
    const int d = demand_at(pipeline_by_stage, s);
    const double rate = service_rate_for_stage(s, profile);
    const double delay = queue_delay_days(d, rate);

    StageQueueDiagnostic diag;
    diag.stage = s;
    diag.stage_name = stage_label(s);
    diag.demand = d;
    diag.service_rate = rate;
    diag.queue_delay_days = delay;
    diag.is_bottleneck = delay > 0.0;
    diag.owner = !diag.is_bottleneck ? OwnerType::None
               : (s == Stage::HmScreen ? OwnerType::Hm : OwnerType::Recruiter);
    diag.confidence = stage_confidence(s, profile);
    c = min_confidence(c, diag.confidence);
    r.stage_diagnostics.push_back(diag);

    r.adjusted_durations.emplace(s, adjust_duration(s, durations, delay));
    r.total_queue_delay_days += delay;
  }
  r.top_bottlenecks = top_bottlenecks(r.stage_diagnostics);
  r.confidence = c;
  return r;
}

SimulationParameters capacity_adjusted_parameters(const SimulationParameters& params,
                                                  const CapacityPenaltyResult& penalty) {
  SimulationParameters out = params;
  for (const auto& [stage, adj] : penalty.adjusted_durations) {
    if (adj.queue_delay_days <= 0.0) continue;
    auto it = params.durations.find(stage);
    out.durations[stage] = it != params.durations.end()
        ? shift_duration(it->second, adj.queue_delay_days)
        : DurationDistribution{ConstantDuration{kDefaultStageDays + adj.queue_delay_days}};
  }
  return out;
}

} // namespace fillcast
