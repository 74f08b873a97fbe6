#include <fillcast/types.hpp>
#include <algorithm>
#include <cctype>

namespace fillcast {

namespace {

struct StageName { Stage stage; const char* name; };

constexpr std::array<StageName, 10> kStageNames{{
  {Stage::Lead,     "LEAD"},
  {Stage::Applied,  "APPLIED"},
  {Stage::Screen,   "SCREEN"},
  {Stage::HmScreen, "HM_SCREEN"},
  {Stage::Onsite,   "ONSITE"},
  {Stage::Final,    "FINAL"},
  {Stage::Offer,    "OFFER"},
  {Stage::Hired,    "HIRED"},
  {Stage::Rejected, "REJECTED"},
  {Stage::Withdrew, "WITHDREW"},
}};

std::string upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

} // namespace

const char* to_string(Stage s) {
  for (const auto& e : kStageNames) {
    if (e.stage == s) return e.name;
  }
  return "UNKNOWN";
}

std::optional<Stage> stage_from_string(std::string_view name) {
  const auto key = upper(name);
  auto it = std::find_if(kStageNames.begin(), kStageNames.end(),
                         [&](const StageName& e){ return key == e.name; });
  if (it == kStageNames.end()) return std::nullopt;
  return it->stage;
}

const char* to_string(Confidence c) {
  switch (c) {
    case Confidence::Insufficient: return "INSUFFICIENT";
    case Confidence::Low:          return "LOW";
    case Confidence::Medium:       return "MEDIUM";
    case Confidence::High:         return "HIGH";
  }
  return "LOW";
}

} // namespace fillcast
