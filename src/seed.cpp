#include <fillcast/seed.hpp>
#include <fillcast/hashing.hpp>
#include <algorithm>
#include <type_traits>
#include <variant>

namespace fillcast {

std::uint64_t pipeline_hash(const std::vector<PipelineCandidate>& pipeline) {
  std::vector<std::pair<std::string, int>> items;
  items.reserve(pipeline.size());
  for (const auto& c : pipeline) items.emplace_back(c.candidate_id, static_cast<int>(c.current_stage));
  std::sort(items.begin(), items.end());

  Fnv1a64 h;
  h.update_u64(items.size());
  for (const auto& [id, stage] : items) {
    h.update_string(id);
    h.update_i64(stage);
  }
  return h.value();
}

void hash_knobs(Fnv1a64& h, const KnobSettings& k) {
  h.update_i64(k.iterations);
  h.update_f64(k.prior_weight);
  h.update_i64(k.min_n);
}

static void hash_stage_map(Fnv1a64& h, const std::map<Stage, double>& m) {
  h.update_u64(m.size());
  for (const auto& [stage, v] : m) {
    h.update_i64(static_cast<int>(stage));
    h.update_f64(v);
  }
}

void hash_levers(Fnv1a64& h, const LeverAdjustments& l) {
  hash_stage_map(h, l.conversion_points);
  hash_stage_map(h, l.duration_percent);
}

static void hash_duration(Fnv1a64& h, const DurationDistribution& d) {
  h.update_u64(d.index());
  std::visit([&](const auto& v) {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, ConstantDuration>) {
      h.update_f64(v.days);
    } else if constexpr (std::is_same_v<T, LognormalDuration>) {
      h.update_f64(v.mu);
      h.update_f64(v.sigma);
    } else {
      h.update_u64(v.buckets.size());
      for (const auto& b : v.buckets) {
        h.update_f64(b.days);
        h.update_f64(b.weight);
      }
    }
  }, d);
}

void hash_parameters(Fnv1a64& h, const SimulationParameters& p) {
  hash_stage_map(h, p.conversion_rates);
  h.update_u64(p.durations.size());
  for (const auto& [stage, d] : p.durations) {
    h.update_i64(static_cast<int>(stage));
    hash_duration(h, d);
  }
  h.update_u64(p.sample_sizes.size());
  for (const auto& [key, n] : p.sample_sizes) {
    h.update_string(key);
    h.update_i64(n);
  }
}

std::string derive_seed(const SeedInputs& in) {
  Fnv1a64 h;
  h.update_string(in.req_id);
  h.update_u64(pipeline_hash(in.pipeline));
  hash_knobs(h, in.knobs);
  hash_levers(h, in.levers);
  return in.req_id + "-" + hash_to_hex(h.value());
}

} // namespace fillcast
