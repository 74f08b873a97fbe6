#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <utility>
#include <string>
#include <vector>

#include <fillcast/errors.hpp>
#include <fillcast/penalty.hpp>

using Catch::Detail::Approx;
using namespace fillcast;

static StageCapacity observed(Stage s, double rate, Confidence c = Confidence::High) {
  return StageCapacity{s, rate, 12, 30, c, rate, rate};
}

// Recruiter r1 screens 3/week; HM h1 known but with no interview history.
static CapacityProfile screen_limited_profile() {
  CapacityProfile p;
  RecruiterCapacity rc;
  rc.recruiter_id = "r1";
  rc.screens_per_week = observed(Stage::Screen, 3.0);
  rc.overall_confidence = Confidence::High;
  p.recruiter = rc;
  HmCapacity hc;
  hc.hm_id = "h1";
  hc.overall_confidence = Confidence::High;
  p.hm = hc;
  p.used_cohort_fallback = false;
  p.overall_confidence = Confidence::High;
  return p;
}

static CapacityProfile fully_observed_profile() {
  auto p = screen_limited_profile();
  p.recruiter->hm_screens_per_week = observed(Stage::HmScreen, 4.0);
  p.recruiter->onsites_per_week = observed(Stage::Onsite, 3.0);
  p.recruiter->offers_per_week = observed(Stage::Offer, 2.0);
  p.hm->interviews_per_week = observed(Stage::HmScreen, 5.0);
  return p;
}

static std::vector<Requisition> open_reqs(int n) {
  std::vector<Requisition> out;
  for (int i = 1; i <= n; ++i) {
    out.push_back({"REQ-" + std::to_string(i), "r1", "h1", ReqStatus::Open, std::nullopt});
  }
  return out;
}

// `count` candidates at `stage`, spread round-robin over reqs REQ-1..REQ-n.
static std::vector<Candidate> spread(Stage stage, int count, int n_reqs, const std::string& prefix = "c") {
  std::vector<Candidate> out;
  for (int i = 0; i < count; ++i) {
    out.push_back({prefix + std::to_string(i), "REQ-" + std::to_string(1 + i % n_reqs), stage, std::nullopt});
  }
  return out;
}

TEST_CASE("queue_delay_days") {
  REQUIRE(queue_delay_days(9, 3) == Approx(14.0));
  REQUIRE(queue_delay_days(3, 3) == Approx(0.0));
  REQUIRE(queue_delay_days(2, 3) == Approx(0.0));
  REQUIRE(queue_delay_days(5, 0) == Approx(0.0));
  REQUIRE(queue_delay_days(100, 1) == Approx(kMaxQueueDelayDays));
  REQUIRE(queue_delay_days(9, 3, 0.5) == Approx(7.0));
  REQUIRE_THROWS_AS(queue_delay_days(9, 3, -1.0), InvalidParameter);
}

TEST_CASE("compute_global_demand") {
  auto reqs = open_reqs(2);
  reqs.push_back({"REQ-X", "r1", "h1", ReqStatus::Closed, std::nullopt});
  auto cands = spread(Stage::Screen, 6, 2);
  auto hm = spread(Stage::HmScreen, 3, 2, "h");
  cands.insert(cands.end(), hm.begin(), hm.end());
  cands.push_back({"gone", "REQ-1", Stage::Screen, Disposition::Withdrawn});
  cands.push_back({"closed", "REQ-X", Stage::Screen, std::nullopt});
  const std::vector<User> users{{"r1", "Riley"}};

  SECTION("both owners: workload across all their open reqs") {
    const auto g = compute_global_demand("REQ-1", {"r1", "h1"}, cands, reqs, users);
    REQUIRE(g.scope == DemandScope::GlobalByRecruiter);
    REQUIRE(g.confidence == Confidence::High);
    REQUIRE(g.recruiter_demand.at(Stage::Screen) == 6);
    REQUIRE(g.recruiter_demand.count(Stage::HmScreen) == 0);
    REQUIRE(g.hm_demand.at(Stage::HmScreen) == 3);
    REQUIRE(g.recruiter_context.open_req_count == 2);
    REQUIRE(g.recruiter_context.candidates_in_flight == 9);
    REQUIRE(g.recruiter_context.name == std::optional<std::string>("Riley"));
    REQUIRE_FALSE(g.hm_context.name.has_value());
    REQUIRE(g.selected_pipeline_total() == 5);
    REQUIRE(std::string(to_string(g.scope)) == "global_by_recruiter");
  }

  SECTION("one owner missing") {
    const auto r = compute_global_demand("REQ-1", {"r1", ""}, cands, reqs, users);
    REQUIRE(r.scope == DemandScope::GlobalByRecruiter);
    REQUIRE(r.confidence == Confidence::Medium);
    REQUIRE(r.hm_demand.empty());

    const auto h = compute_global_demand("REQ-1", {"", "h1"}, cands, reqs, users);
    REQUIRE(h.scope == DemandScope::GlobalByHm);
    REQUIRE(h.confidence == Confidence::Medium);
    REQUIRE(h.recruiter_demand.empty());
  }

  SECTION("both owners missing") {
    const auto g = compute_global_demand("REQ-1", {"", ""}, cands, reqs, users);
    REQUIRE(g.scope == DemandScope::SingleReq);
    REQUIRE(g.confidence == Confidence::Low);
    REQUIRE(g.confidence_reasons.front().message ==
            "Both recruiter_id and hm_id missing - using single-req fallback");
  }

  SECTION("empty selected pipeline") {
    const auto g = compute_global_demand("REQ-404", {"r1", "h1"}, cands, reqs, users);
    REQUIRE(g.confidence == Confidence::Low);
    REQUIRE(g.confidence_reasons.back().message == "Selected req has 0 active candidates in pipeline");
  }
}

TEST_CASE("recruiter screening 3/week against 9 candidates") {
  const auto profile = screen_limited_profile();
  const auto g = compute_global_demand("REQ-1", {"r1", "h1"}, spread(Stage::Screen, 9, 2), open_reqs(2), {});
  std::map<Stage, DurationDistribution> durations{{Stage::Screen, ConstantDuration{5.0}}};

  const auto r = apply_capacity_penalty_v11(durations, g, profile);

  REQUIRE(r.total_queue_delay_days > 0.0);
  REQUIRE(r.total_queue_delay_days == Approx(14.0));
  REQUIRE(r.top_bottlenecks.size() == 1);
  REQUIRE(r.top_bottlenecks[0].stage == Stage::Screen);
  REQUIRE(r.top_bottlenecks[0].owner == OwnerType::Recruiter);
  REQUIRE(r.top_bottlenecks[0].demand == 9);
  REQUIRE(r.top_bottlenecks[0].service_rate == Approx(3.0));

  const auto& adj = r.adjusted_durations.at(Stage::Screen);
  REQUIRE(adj.original_median_days == Approx(5.0));
  REQUIRE(adj.adjusted_median_days == Approx(19.0));
  REQUIRE(std::get<ConstantDuration>(adj.adjusted).days == Approx(19.0));

  SECTION("diagnostics cover every capacity-limited stage") {
    REQUIRE(r.stage_diagnostics.size() == kCapacityLimitedStages.size());
    for (const auto& d : r.stage_diagnostics) {
      if (d.stage != Stage::Screen) {
        REQUIRE_FALSE(d.is_bottleneck);
        REQUIRE(d.owner == OwnerType::None);
      }
    }
  }

  SECTION("throughput recommendation is hedged by profile confidence") {
    REQUIRE_FALSE(r.recommendations.empty());
    const auto& rec = r.recommendations.front();
    REQUIRE(rec.type == RecommendationType::IncreaseThroughput);
    REQUIRE(rec.description == "Based on observed patterns: Increase Screen throughput to ~10/week");
    REQUIRE(rec.estimated_impact_days == 10);
    REQUIRE(rec.target_value == Approx(10.0));
  }

  SECTION("stage confidence falls back to LOW where capacity is a prior") {
    REQUIRE(r.confidence == Confidence::Low);
  }
}

TEST_CASE("HM screen demand is owned by the HM") {
  const auto profile = screen_limited_profile();
  const auto g = compute_global_demand("REQ-1", {"r1", "h1"}, spread(Stage::HmScreen, 10, 2), open_reqs(2), {});
  const auto r = apply_capacity_penalty_v11({}, g, profile);

  // No observed interview rate: cohort default of 4/week.
  REQUIRE(r.top_bottlenecks.size() == 1);
  REQUIRE(r.top_bottlenecks[0].stage == Stage::HmScreen);
  REQUIRE(r.top_bottlenecks[0].owner == OwnerType::Hm);
  REQUIRE(r.top_bottlenecks[0].queue_delay_days == Approx(10.5));
  // Missing duration is treated as the 7-day default.
  REQUIRE(r.adjusted_durations.at(Stage::HmScreen).adjusted_median_days == Approx(17.5));
}

TEST_CASE("top bottlenecks are the three longest delays") {
  const auto profile = fully_observed_profile();
  std::vector<Candidate> cands;
  for (auto [stage, n] : std::vector<std::pair<Stage, int>>{
           {Stage::Screen, 6}, {Stage::HmScreen, 12}, {Stage::Onsite, 5}, {Stage::Offer, 7}}) {
    auto more = spread(stage, n, 2, to_string(stage));
    cands.insert(cands.end(), more.begin(), more.end());
  }
  const auto g = compute_global_demand("REQ-1", {"r1", "h1"}, cands, open_reqs(2), {});
  const auto r = apply_capacity_penalty_v11({}, g, profile);

  REQUIRE(r.top_bottlenecks.size() == 3);
  REQUIRE(std::is_sorted(r.top_bottlenecks.begin(), r.top_bottlenecks.end(),
                         [](const auto& a, const auto& b){ return a.queue_delay_days > b.queue_delay_days; }));
  REQUIRE(r.top_bottlenecks[0].stage == Stage::Offer);      // 7 vs 2/week: 17.5 days
  REQUIRE(r.top_bottlenecks[1].stage == Stage::HmScreen);   // 12 vs 5/week: 9.8 days
  REQUIRE(r.top_bottlenecks[2].stage == Stage::Screen);     // 6 vs 3/week: 7 days
  REQUIRE(r.total_queue_delay_days == Approx(17.5 + 9.8 + 7.0 + 14.0 / 3.0));
  REQUIRE(r.confidence == Confidence::High);
}

TEST_CASE("confidence rules for the global-demand penalty") {
  const auto g = compute_global_demand("REQ-1", {"r1", "h1"}, spread(Stage::Screen, 2, 2), open_reqs(2), {});

  SECTION("cohort fallback forces LOW") {
    auto p = fully_observed_profile();
    p.used_cohort_fallback = true;
    REQUIRE(apply_capacity_penalty_v11({}, g, p).confidence == Confidence::Low);
  }

  SECTION("missing HM profile alone is not enough to force LOW") {
    auto p = fully_observed_profile();
    p.hm.reset();
    // HM_SCREEN still has an observed recruiter rate.
    REQUIRE(apply_capacity_penalty_v11({}, g, p).confidence == Confidence::High);
  }

  SECTION("both ids missing gives LOW and a data recommendation") {
    const auto none = compute_global_demand("REQ-1", {"", ""}, spread(Stage::Screen, 2, 2), open_reqs(2), {});
    const auto r = apply_capacity_penalty_v11({}, none, fully_observed_profile());
    REQUIRE(r.confidence == Confidence::Low);
    REQUIRE(r.recommendations.back().type == RecommendationType::ImproveData);
  }
}

TEST_CASE("reassign recommendation for an owner with many open reqs") {
  auto profile = screen_limited_profile();
  profile.overall_confidence = Confidence::Medium;
  const auto g = compute_global_demand("REQ-1", {"r1", "h1"}, spread(Stage::Screen, 9, 5), open_reqs(5), {});
  const auto r = apply_capacity_penalty_v11({}, g, profile);

  auto it = std::find_if(r.recommendations.begin(), r.recommendations.end(),
                         [](const Recommendation& x){ return x.type == RecommendationType::ReassignWorkload; });
  REQUIRE(it != r.recommendations.end());
  // ceil((9 - 3) / (9 / 5))
  REQUIRE(it->description == "Based on similar cohorts: Reassign ~4 req(s) to reduce Recruiter load");
  REQUIRE(it->estimated_impact_days == 7);
  REQUIRE(it->target_value == Approx(1.0));
}

TEST_CASE("legacy single-req penalty") {
  const auto profile = screen_limited_profile();
  std::map<Stage, DurationDistribution> durations{{Stage::Screen, ConstantDuration{5.0}}};
  const auto r = apply_capacity_penalty(durations, {{Stage::Screen, 9}}, profile);
  REQUIRE(r.total_queue_delay_days == Approx(14.0));
  REQUIRE(r.top_bottlenecks.at(0).owner == OwnerType::Recruiter);
  REQUIRE(r.recommendations.empty());
  REQUIRE_FALSE(r.global_demand.has_value());
}

TEST_CASE("capacity_adjusted_parameters") {
  SimulationParameters p;
  p.conversion_rates = {{Stage::Screen, 0.6}, {Stage::Onsite, 0.5}, {Stage::Offer, 0.8}};
  p.durations[Stage::Screen] = LognormalDuration{std::log(5.0), 0.4};
  p.durations[Stage::Offer] = ConstantDuration{3.0};

  const auto profile = screen_limited_profile();
  const auto r = apply_capacity_penalty(p.durations, {{Stage::Screen, 9}, {Stage::Onsite, 6}}, profile);
  const auto adj = capacity_adjusted_parameters(p, r);

  REQUIRE(std::exp(std::get<LognormalDuration>(adj.durations.at(Stage::Screen)).mu) == Approx(19.0));
  // ONSITE had no duration: 7-day default plus (6 - 3) / 3 * 7.
  REQUIRE(std::get<ConstantDuration>(adj.durations.at(Stage::Onsite)).days == Approx(14.0));
  REQUIRE(std::get<ConstantDuration>(adj.durations.at(Stage::Offer)).days == Approx(3.0));
  REQUIRE(adj.conversion_rates == p.conversion_rates);
}

TEST_CASE("service_rate_for_stage falls back to cohort defaults") {
  CapacityProfile empty;
  REQUIRE(service_rate_for_stage(Stage::Screen, empty) == Approx(8.0));
  REQUIRE(service_rate_for_stage(Stage::HmScreen, empty) == Approx(4.0));
  REQUIRE(service_rate_for_stage(Stage::Onsite, empty) == Approx(3.0));
  REQUIRE(service_rate_for_stage(Stage::Offer, empty) == Approx(1.5));

  const auto p = fully_observed_profile();
  REQUIRE(service_rate_for_stage(Stage::HmScreen, p) == Approx(5.0));
}
