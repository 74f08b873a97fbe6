#pragma once
#include <cstdint>
#include <mutex>

namespace fillcast {

// Latest-only mailbox between a producer thread and a polling consumer.
// Older values are overwritten; the consumer sees each publication at most once.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lk(mu_);
    data_ = v;
    ++seq_;
  }

  // Copies the latest value if the sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (seq_ == cursor) return false;
    out = data_;
    cursor = seq_;
    return true;
  }

  std::uint64_t sequence() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
  }

private:
  mutable std::mutex mu_;
  T data_{};
  std::uint64_t seq_ = 0;
};

} // namespace fillcast
