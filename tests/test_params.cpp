#include <catch2/catch.hpp>
#include <cmath>
#include <sstream>
#include <string>

#include <fillcast/params.hpp>

using Catch::Detail::Approx;
using namespace fillcast;

static std::string csv_minimal = R"(stage,rate,rate_n,kind,arg1,arg2,duration_n
SCREEN,0.6,40,constant,5,,40
ONSITE,0.5,12,lognormal,2.3,0.4,12
OFFER,0.8,,empirical,2:1|5:3,,
)";

static std::string csv_with_noise = R"( Stage , rate , rate_n , kind , arg1 , arg2 , duration_n
# fitted 2026-09-30
screen , 0.6 , 40 , constant , 5 , , 40

HM_SCREEN, 1.7, 10, constant, 3, , 10
BOGUS, 0.5, 10, constant, 3, , 10
ONSITE, 0.5, 12, lognormal, 2.3, -1, 12
OFFER, 0.8, 9
)";

TEST_CASE("parameters_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  const auto p = parameters_from_csv_stream(ss);

  REQUIRE(p.conversion_rates.size() == 3);
  REQUIRE(p.conversion_rates.at(Stage::Screen) == Approx(0.6));
  REQUIRE(p.conversion_rates.at(Stage::Onsite) == Approx(0.5));
  REQUIRE(p.conversion_rates.at(Stage::Offer) == Approx(0.8));

  REQUIRE(std::get<ConstantDuration>(p.durations.at(Stage::Screen)).days == Approx(5.0));
  const auto& l = std::get<LognormalDuration>(p.durations.at(Stage::Onsite));
  REQUIRE(l.mu == Approx(2.3));
  REQUIRE(l.sigma == Approx(0.4));
  const auto& e = std::get<EmpiricalDuration>(p.durations.at(Stage::Offer));
  REQUIRE(e.buckets.size() == 2);
  REQUIRE(e.buckets[1].days == Approx(5.0));
  REQUIRE(e.buckets[1].weight == Approx(3.0));

  REQUIRE(sample_size(p, "SCREEN_rate") == 40);
  REQUIRE(sample_size(p, "ONSITE_duration") == 12);
  REQUIRE_FALSE(sample_size(p, "OFFER_rate").has_value());
}

TEST_CASE("parameters_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  const auto p = parameters_from_csv_stream(ss);

  // rate 1.7, unknown stage and sigma < 0 are skipped; a rate-only row is kept.
  REQUIRE(p.conversion_rates.count(Stage::Screen) == 1);
  REQUIRE(p.conversion_rates.count(Stage::HmScreen) == 0);
  REQUIRE(p.conversion_rates.count(Stage::Onsite) == 0);
  REQUIRE(p.conversion_rates.at(Stage::Offer) == Approx(0.8));
  REQUIRE(p.durations.count(Stage::Offer) == 0);
  REQUIRE(sample_size(p, "OFFER_rate") == 9);
}

TEST_CASE("load_parameters_csv returns nullopt on missing file") {
  auto none = load_parameters_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}

TEST_CASE("stage priors catalog") {
  REQUIRE(stage_priors().size() == 8);
  auto screen = stage_prior(Stage::Screen);
  REQUIRE(screen.has_value());
  REQUIRE(screen->pass_rate == Approx(0.4));
  REQUIRE(screen->median_days == Approx(5.0));
  REQUIRE_FALSE(stage_prior(Stage::Rejected).has_value());
}

TEST_CASE("sample size keys") {
  REQUIRE(rate_key(Stage::HmScreen) == "HM_SCREEN_rate");
  REQUIRE(duration_key(Stage::Offer) == "OFFER_duration");
}

TEST_CASE("stage names round trip") {
  REQUIRE(stage_from_string("hm_screen") == Stage::HmScreen);
  REQUIRE(std::string(to_string(Stage::Withdrew)) == "WITHDREW");
  REQUIRE_FALSE(stage_from_string("PHONE").has_value());
}
