#include <fillcast/duration.hpp>
#include <fillcast/errors.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace fillcast {

// Upper bound on a single sampled dwell (ten years); keeps exp() tails finite.
static constexpr double kMaxSampledDays = 3650.0;

static inline int whole_days(double d) {
  return static_cast<int>(std::lround(std::min(d, kMaxSampledDays)));
}

static double bucket_weight_total(const EmpiricalDuration& e) {
  double total = 0.0;
  for (const auto& b : e.buckets) total += b.weight;
  return total;
}

void validate_duration(const DurationDistribution& d) {
  if (const auto* c = std::get_if<ConstantDuration>(&d)) {
    if (!std::isfinite(c->days) || c->days < 1.0) {
      throw InvalidParameter("constant duration must be >= 1 day");
    }
  } else if (const auto* l = std::get_if<LognormalDuration>(&d)) {
    if (!std::isfinite(l->mu) || !std::isfinite(l->sigma) || l->sigma < 0.0) {
      throw InvalidParameter("lognormal duration needs finite mu and sigma >= 0");
    }
  } else {
    const auto& e = std::get<EmpiricalDuration>(d);
    if (e.buckets.empty()) throw InvalidParameter("empirical duration has no buckets");
    for (const auto& b : e.buckets) {
      if (!std::isfinite(b.days) || !std::isfinite(b.weight) || b.days < 0.0 || b.weight < 0.0) {
        throw InvalidParameter("empirical bucket needs days >= 0 and weight >= 0");
      }
    }
    if (bucket_weight_total(e) <= 0.0) {
      throw InvalidParameter("empirical duration has zero total weight");
    }
  }
}

int sample_duration(const DurationDistribution& d, std::mt19937& rng) {
  validate_duration(d);
  std::uniform_real_distribution<double> U(0.0, 1.0);

  if (const auto* c = std::get_if<ConstantDuration>(&d)) {
    return whole_days(c->days);
  }

  if (const auto* l = std::get_if<LognormalDuration>(&d)) {
    // Box-Muller; 1 - U keeps log() away from zero.
    const double u1 = 1.0 - U(rng);
    const double u2 = U(rng);
    const double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
    return std::max(1, whole_days(std::exp(l->mu + l->sigma * z)));
  }

  // Inverse transform over the bucket weights.
  const auto& e = std::get<EmpiricalDuration>(d);
  const double r = U(rng) * bucket_weight_total(e);
  double cumulative = 0.0;
  for (const auto& b : e.buckets) {
    cumulative += b.weight;
    if (r < cumulative) return whole_days(b.days);
  }
  return whole_days(e.buckets.back().days);
}

double median_days(const DurationDistribution& d) {
  validate_duration(d);
  if (const auto* c = std::get_if<ConstantDuration>(&d)) return c->days;
  if (const auto* l = std::get_if<LognormalDuration>(&d)) return std::exp(l->mu);

  const auto& e = std::get<EmpiricalDuration>(d);
  const double half = 0.5 * bucket_weight_total(e);
  double cumulative = 0.0;
  for (const auto& b : e.buckets) {
    cumulative += b.weight;
    if (cumulative >= half) return b.days;
  }
  return e.buckets.back().days;
}

DurationDistribution shift_duration(const DurationDistribution& d, double delay_days) {
  validate_duration(d);
  if (!(delay_days > 0.0)) return d;

  if (const auto* c = std::get_if<ConstantDuration>(&d)) {
    return ConstantDuration{c->days + delay_days};
  }
  if (const auto* l = std::get_if<LognormalDuration>(&d)) {
    // Move the median: exp(mu') = exp(mu) + delay. Same z => longer sample.
    const double new_median = std::max(1.0, std::exp(l->mu) + delay_days);
    return LognormalDuration{std::max(l->mu, std::log(new_median)), l->sigma};
  }
  auto e = std::get<EmpiricalDuration>(d);
  for (auto& b : e.buckets) b.days += delay_days;
  return e;
}

} // namespace fillcast
