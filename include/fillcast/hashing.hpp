#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fillcast {

// Stable FNV-1a 64-bit hash. Not std::hash: seeds and cache keys must be
// identical across processes and platforms.
class Fnv1a64 {
public:
  static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr std::uint64_t kPrime       = 1099511628211ull;

  std::uint64_t value() const { return h_; }

  void update_bytes(const void* data, std::size_t n);
  void update_u64(std::uint64_t v);  // little-endian byte order
  void update_i64(std::int64_t v) { update_u64(static_cast<std::uint64_t>(v)); }
  void update_f64(double x);         // -0.0 and NaN canonicalized
  void update_string(std::string_view s); // length-delimited

private:
  std::uint64_t h_ = kOffsetBasis;
};

std::uint64_t hash_string(std::string_view s);

// SplitMix64 finalizer; spreads nearby inputs (block indices) apart.
std::uint64_t mix64(std::uint64_t x);

std::string hash_to_hex(std::uint64_t h);

} // namespace fillcast
