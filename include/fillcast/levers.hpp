#pragma once
#include <istream>
#include <map>
#include <fillcast/params.hpp>
#include <fillcast/shrinkage.hpp>

namespace fillcast {

// Tunable model settings ("knobs"). Part of the seed and the cache key.
struct KnobSettings {
  int iterations = 1000;
  double prior_weight = kDefaultPriorWeight; // virtual sample size m
  int min_n = 5;                             // below this, fits are not trusted
};

// What-if adjustments ("levers") applied on top of the fitted parameters.
struct LeverAdjustments {
  std::map<Stage, double> conversion_points; // percentage points added to the rate
  std::map<Stage, double> duration_percent;  // +20 = 20% longer, -50 = half
  bool empty() const { return conversion_points.empty() && duration_percent.empty(); }
};

// Locally observed pass rate for a stage and how many candidates back it.
struct StageEvidence {
  double observed_rate = 0.0;
  int n = 0;
};

inline constexpr double kMinLeverRate = 0.05;
inline constexpr double kMaxLeverRate = 0.99;

// Throws InvalidParameter on negative iterations, prior weight or min_n.
void validate_knobs(const KnobSettings& k);

// Builds the parameters a what-if run simulates:
//  - rates of SCREEN/HM_SCREEN/ONSITE/OFFER shrunk toward the stage prior when
//    evidence exists, shifted by lever points, clamped to [0.05, 0.99];
//  - lognormal fits backed by fewer than min_n samples replaced by a constant
//    at the stage prior median;
//  - durations scaled by the duration lever.
// Stages absent from base are left absent.
SimulationParameters apply_levers(const SimulationParameters& base,
                                  const std::map<Stage, StageEvidence>& evidence,
                                  const KnobSettings& knobs,
                                  const LeverAdjustments& levers);

// "key = value" lines for iterations, prior_weight, min_n. Blank lines and '#'
// comments are ignored; unknown keys and bad values are skipped with a warning.
KnobSettings knobs_from_stream(std::istream& in, KnobSettings defaults = {});

} // namespace fillcast
