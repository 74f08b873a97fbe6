#pragma once
#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fillcast {

using Date = std::chrono::sys_days;

// Canonical pipeline stages. Order matters: funnel stages advance in
// declaration order from Screen to Hired.
enum class Stage : int {
  Lead = 0,
  Applied,
  Screen,
  HmScreen,
  Onsite,
  Final,
  Offer,
  Hired,
  Rejected,
  Withdrew
};

// Stages a candidate walks through in simulation, ending in Hired.
inline constexpr std::array<Stage, 4> kFunnelStages{
  Stage::Screen, Stage::HmScreen, Stage::Onsite, Stage::Offer
};

const char* to_string(Stage s);
std::optional<Stage> stage_from_string(std::string_view name); // case-insensitive

inline bool is_terminal(Stage s) {
  return s == Stage::Hired || s == Stage::Rejected || s == Stage::Withdrew;
}

// Ordered: aggregation takes the minimum.
enum class Confidence : int { Insufficient = 0, Low = 1, Medium = 2, High = 3 };

const char* to_string(Confidence c);

inline Confidence min_confidence(Confidence a, Confidence b) {
  return static_cast<int>(a) < static_cast<int>(b) ? a : b;
}

inline Confidence downgrade(Confidence c) {
  return c == Confidence::Insufficient ? c : static_cast<Confidence>(static_cast<int>(c) - 1);
}

inline Date add_days(Date d, int days) { return d + std::chrono::days{days}; }

inline int days_between(Date from, Date to) {
  return static_cast<int>((to - from).count());
}

} // namespace fillcast
