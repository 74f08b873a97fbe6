#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <fillcast/hashing.hpp>
#include <fillcast/levers.hpp>
#include <fillcast/params.hpp>

namespace fillcast {

// Order-independent hash of the pipeline composition (candidate id + stage).
std::uint64_t pipeline_hash(const std::vector<PipelineCandidate>& pipeline);

struct SeedInputs {
  std::string req_id;
  std::vector<PipelineCandidate> pipeline;
  KnobSettings knobs{};
  LeverAdjustments levers{};
};

// Deterministic seed string for a what-if run: identical inputs always give
// the same seed, any change to the pipeline, knobs or levers gives a new one.
std::string derive_seed(const SeedInputs& in);

// Feeds knobs / levers into a running hash (shared with the cache key).
void hash_knobs(Fnv1a64& h, const KnobSettings& k);
void hash_levers(Fnv1a64& h, const LeverAdjustments& l);

// Rates, every duration's fields and the sample sizes.
void hash_parameters(Fnv1a64& h, const SimulationParameters& p);

} // namespace fillcast
