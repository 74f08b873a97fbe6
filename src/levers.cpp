#include <fillcast/levers.hpp>
#include <fillcast/errors.hpp>
#include <fillcast/log.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include "text.hpp"

namespace fillcast {

static inline double clamp_rate(double r) {
  return std::clamp(r, kMinLeverRate, kMaxLeverRate);
}

static double lever_value(const std::map<Stage, double>& m, Stage s) {
  auto it = m.find(s);
  return it == m.end() ? 0.0 : it->second;
}

void validate_knobs(const KnobSettings& k) {
  if (k.iterations < 0) throw InvalidParameter("knobs: iterations must be >= 0");
  if (!std::isfinite(k.prior_weight) || k.prior_weight < 0.0) {
    throw InvalidParameter("knobs: prior_weight must be finite and >= 0");
  }
  if (k.min_n < 0) throw InvalidParameter("knobs: min_n must be >= 0");
}

static DurationDistribution scale_duration(const DurationDistribution& d, double pct) {
  if (pct == 0.0) return d;
  if (!std::isfinite(pct) || pct <= -100.0) {
    throw InvalidParameter("duration lever must be > -100%");
  }
  const double factor = 1.0 + pct / 100.0;
  if (const auto* c = std::get_if<ConstantDuration>(&d)) {
    return ConstantDuration{std::max(1.0, std::round(c->days * factor))};
  }
  if (const auto* l = std::get_if<LognormalDuration>(&d)) {
    return LognormalDuration{l->mu + std::log(factor), l->sigma};
  }
  auto e = std::get<EmpiricalDuration>(d);
  for (auto& b : e.buckets) b.days *= factor;
  return e;
}

SimulationParameters apply_levers(const SimulationParameters& base,
                                  const std::map<Stage, StageEvidence>& evidence,
                                  const KnobSettings& knobs,
                                  const LeverAdjustments& levers) {
  validate_knobs(knobs);
  SimulationParameters out = base;

  for (Stage s : kFunnelStages) {
    const auto prior = stage_prior(s);

    if (auto it = out.conversion_rates.find(s); it != out.conversion_rates.end()) {
      double rate = it->second;
      bool touched = false;

      auto ev = evidence.find(s);
      if (ev != evidence.end() && prior && (ev->second.n > 0 || knobs.prior_weight > 0.0)) {
        rate = shrink_rate(ev->second.observed_rate, prior->pass_rate,
                           std::max(0, ev->second.n), knobs.prior_weight);
        touched = true;
      }
      const double points = lever_value(levers.conversion_points, s);
      if (points != 0.0) {
        rate += points / 100.0;
        touched = true;
      }
      it->second = touched ? clamp_rate(rate) : rate;
    }

    if (auto it = out.durations.find(s); it != out.durations.end()) {
      const double pct = lever_value(levers.duration_percent, s);
      const auto n = sample_size(base, duration_key(s));
      const bool thin = n && *n < knobs.min_n;

      if (thin && prior && std::holds_alternative<LognormalDuration>(it->second)) {
        const double days = prior->median_days * (1.0 + pct / 100.0);
        it->second = ConstantDuration{std::max(1.0, std::round(days))};
      } else {
        it->second = scale_duration(it->second, pct);
      }
    }
  }
  return out;
}

KnobSettings knobs_from_stream(std::istream& in, KnobSettings defaults) {
  KnobSettings k = defaults;
  std::string line;
  while (std::getline(in, line)) {
    std::string raw = text::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      log_warn("knobs: expected key = value, got '" + raw + "'");
      continue;
    }
    const auto key = text::lower(text::trim(raw.substr(0, eq)));
    const auto val = text::trim(raw.substr(eq + 1));

    if (key == "iterations" || key == "min_n") {
      auto v = text::to_int(val);
      if (!v || *v < 0) { log_warn("knobs: bad value for " + key); continue; }
      (key == "iterations" ? k.iterations : k.min_n) = *v;
    } else if (key == "prior_weight") {
      auto v = text::to_double(val);
      if (!v || !std::isfinite(*v) || *v < 0.0) { log_warn("knobs: bad value for " + key); continue; }
      k.prior_weight = *v;
    } else {
      log_warn("knobs: unknown key '" + key + "'");
    }
  }
  return k;
}

} // namespace fillcast
