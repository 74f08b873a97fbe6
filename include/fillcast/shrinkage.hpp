#pragma once

namespace fillcast {

inline constexpr double kDefaultPriorWeight = 5.0;

// Empirical-Bayes shrinkage of an observed rate toward a prior:
//   (n*observed + m*prior) / (n + m)
// n = 0 returns the prior, m = 0 returns the observed rate.
// Throws InvalidParameter when n = m = 0, either is negative, or any input
// is non-finite.
double shrink_rate(double observed, double prior, double n,
                   double prior_weight = kDefaultPriorWeight);

} // namespace fillcast
