#pragma once
#include <random>
#include <variant>
#include <vector>

namespace fillcast {

// Fixed dwell time (days >= 1). Small-sample fallback and post-penalty shape.
struct ConstantDuration {
  double days = 7.0;
};

// Dwell time in days ~ exp(N(mu, sigma)). mu and sigma are fitted upstream
// in log-space.
struct LognormalDuration {
  double mu = 0.0;
  double sigma = 1.0;
};

struct DurationBucket {
  double days = 0.0;
  double weight = 0.0; // relative; need not sum to 1
};

// Discrete distribution over bucketed dwell times.
struct EmpiricalDuration {
  std::vector<DurationBucket> buckets;
};

using DurationDistribution = std::variant<ConstantDuration, LognormalDuration, EmpiricalDuration>;

// Used when a stage has a conversion rate but no duration distribution.
inline constexpr double kDefaultStageDays = 7.0;

// Draws one dwell time in whole days (>= 1 for constant and lognormal).
// RNG draws per call are fixed by the alternative: constant 0, lognormal 2,
// empirical 1. Throws InvalidParameter on malformed parameters.
int sample_duration(const DurationDistribution& d, std::mt19937& rng);

// Median dwell time in days (lognormal: exp(mu)).
double median_days(const DurationDistribution& d);

// Same alternative with the median extended by delay_days. No sample gets
// shorter; constant and empirical samples grow by the full delay, lognormal
// draws below the median by less. Non-positive delays return d unchanged.
DurationDistribution shift_duration(const DurationDistribution& d, double delay_days);

// Throws InvalidParameter when d cannot be sampled.
void validate_duration(const DurationDistribution& d);

} // namespace fillcast
