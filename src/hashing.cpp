#include <fillcast/hashing.hpp>
#include <array>
#include <bit>
#include <cmath>

namespace fillcast {

void Fnv1a64::update_bytes(const void* data, std::size_t n) {
  const auto* p = static_cast<const unsigned char*>(data);
  if (p == nullptr) return;
  for (std::size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<std::uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

void Fnv1a64::update_u64(std::uint64_t v) {
  std::array<unsigned char, 8> b{};
  for (std::size_t i = 0; i < b.size(); ++i) {
    b[i] = static_cast<unsigned char>((v >> (8 * i)) & 0xFFu);
  }
  update_bytes(b.data(), b.size());
}

void Fnv1a64::update_f64(double x) {
  if (std::isnan(x)) x = std::bit_cast<double>(0x7ff8000000000000ull);
  if (x == 0.0) x = 0.0; // folds -0.0
  update_u64(std::bit_cast<std::uint64_t>(x));
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<std::uint64_t>(s.size()));
  update_bytes(s.data(), s.size());
}

std::uint64_t hash_string(std::string_view s) {
  Fnv1a64 h;
  h.update_string(s);
  return h.value();
}

std::uint64_t mix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ull;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
  return x ^ (x >> 31);
}

std::string hash_to_hex(std::uint64_t h) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kDigits[h & 0xFu];
    h >>= 4;
  }
  return out;
}

} // namespace fillcast
