#include <fillcast/params.hpp>
#include <fillcast/errors.hpp>
#include <fillcast/log.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include "text.hpp"

namespace fillcast {

std::string rate_key(Stage s) { return std::string(to_string(s)) + "_rate"; }
std::string duration_key(Stage s) { return std::string(to_string(s)) + "_duration"; }

std::optional<int> sample_size(const SimulationParameters& p, const std::string& key) {
  auto it = p.sample_sizes.find(key);
  if (it == p.sample_sizes.end()) return std::nullopt;
  return it->second;
}

static std::vector<StagePrior> make_priors_builtin() {
  return {
    {Stage::Lead,     0.30, 3.0},
    {Stage::Applied,  0.50, 2.0},
    {Stage::Screen,   0.40, 5.0},
    {Stage::HmScreen, 0.50, 7.0},
    {Stage::Onsite,   0.40, 10.0},
    {Stage::Final,    0.60, 3.0},
    {Stage::Offer,    0.80, 5.0},
    {Stage::Hired,    1.00, 0.0},
  };
}

const std::vector<StagePrior>& stage_priors() {
  static const std::vector<StagePrior> cat = make_priors_builtin();
  return cat;
}

std::optional<StagePrior> stage_prior(Stage s) {
  const auto& cat = stage_priors();
  auto it = std::find_if(cat.begin(), cat.end(), [&](const StagePrior& p){ return p.stage == s; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && text::lower(cols[0]) == "stage";
}

static std::optional<EmpiricalDuration> parse_buckets(const std::string& field) {
  EmpiricalDuration e;
  for (const auto& item : text::split(field, '|')) {
    const auto pair = text::split(item, ':');
    if (pair.size() != 2) return std::nullopt;
    const auto days = text::to_double(pair[0]);
    const auto weight = text::to_double(pair[1]);
    if (!days || !weight) return std::nullopt;
    e.buckets.push_back({*days, *weight});
  }
  return e;
}

static std::optional<DurationDistribution> parse_distribution(const std::string& kind_raw,
                                                              const std::string& a1,
                                                              const std::string& a2) {
  const auto kind = text::lower(kind_raw);
  std::optional<DurationDistribution> d;
  if (kind == "constant") {
    if (auto days = text::to_double(a1)) d = ConstantDuration{*days};
  } else if (kind == "lognormal") {
    auto mu = text::to_double(a1);
    auto sigma = text::to_double(a2);
    if (mu && sigma) d = LognormalDuration{*mu, *sigma};
  } else if (kind == "empirical") {
    if (auto e = parse_buckets(a1)) d = std::move(*e);
  }
  if (!d) return std::nullopt;
  try {
    validate_duration(*d);
  } catch (const InvalidParameter& e) {
    log_warn(std::string("parameters: ") + e.what());
    return std::nullopt;
  }
  return d;
}

// Applies one row to out. Returns false when the row is unusable.
static bool apply_row(const std::vector<std::string>& cols, SimulationParameters& out) {
  if (cols.size() < 2) return false;
  const auto stage = stage_from_string(cols[0]);
  if (!stage) return false;

  auto col = [&](std::size_t i) -> std::string { return i < cols.size() ? cols[i] : std::string{}; };

  std::optional<double> rate;
  if (!col(1).empty()) {
    rate = text::to_double(col(1));
    if (!rate || !std::isfinite(*rate) || *rate < 0.0 || *rate > 1.0) return false;
  }

  std::optional<DurationDistribution> dist;
  if (!col(3).empty()) {
    dist = parse_distribution(col(3), col(4), col(5));
    if (!dist) return false;
  }
  if (!rate && !dist) return false;

  if (rate) {
    out.conversion_rates[*stage] = *rate;
    if (auto n = text::to_int(col(2)); n && *n >= 0) out.sample_sizes[rate_key(*stage)] = *n;
  }
  if (dist) {
    out.durations[*stage] = std::move(*dist);
    if (auto n = text::to_int(col(6)); n && *n >= 0) out.sample_sizes[duration_key(*stage)] = *n;
  }
  return true;
}

SimulationParameters parameters_from_csv_stream(std::istream& in) {
  SimulationParameters out;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = text::trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = text::split(raw, ',');

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (!apply_row(cols, out)) {
      log_warn("parameters: skipped invalid row " + std::to_string(line_no));
    }
  }
  return out;
}

std::optional<SimulationParameters> load_parameters_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return parameters_from_csv_stream(f);
}

} // namespace fillcast
