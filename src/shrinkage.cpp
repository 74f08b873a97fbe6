#include <fillcast/shrinkage.hpp>
#include <fillcast/errors.hpp>
#include <cmath>
#include <string>

namespace fillcast {

double shrink_rate(double observed, double prior, double n, double prior_weight) {
  if (!std::isfinite(observed) || !std::isfinite(prior) ||
      !std::isfinite(n) || !std::isfinite(prior_weight)) {
    throw InvalidParameter("shrink_rate: non-finite input");
  }
  if (n < 0.0 || prior_weight < 0.0) {
    throw InvalidParameter("shrink_rate: negative sample size or prior weight (n=" +
                           std::to_string(n) + ", m=" + std::to_string(prior_weight) + ")");
  }
  if (n == 0.0 && prior_weight == 0.0) {
    throw InvalidParameter("shrink_rate: n and prior weight are both zero");
  }
  if (n == 0.0) return prior;
  if (prior_weight == 0.0) return observed;

  // Weighted average of the two estimates by their (virtual) sample sizes.
  return (n * observed + prior_weight * prior) / (n + prior_weight);
}

} // namespace fillcast
