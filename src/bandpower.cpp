#include "biostream/bandpower.hpp"

#include "biostream/channel_table.hpp"
#include "biostream/periodogram.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace biostream {

const std::array<BandDefinition, kNumBands>& standard_bands() {
  static const std::array<BandDefinition, kNumBands> bands = {{
      {Band::Delta, "delta", 0.5, 4.0},
      {Band::Theta, "theta", 4.0, 8.0},
      {Band::Alpha, "alpha", 8.0, 12.0},
      {Band::Beta, "beta", 12.0, 30.0},
      {Band::Gamma, "gamma", 30.0, 50.0},
  }};
  return bands;
}

const char* band_name(Band b) {
  switch (b) {
    case Band::Delta: return "delta";
    case Band::Theta: return "theta";
    case Band::Alpha: return "alpha";
    case Band::Beta: return "beta";
    case Band::Gamma: return "gamma";
  }
  return "unknown";
}

void normalize_band_powers(BandPowerSnapshot* s) {
  if (!s) return;
  double total = 0.0;
  for (const auto& bp : s->bands) total += bp.absolute;
  s->total = total;
  for (auto& bp : s->bands) {
    bp.relative = (total > 0.0) ? (bp.absolute / total) : 0.0;
  }
}

BandPowerSnapshot compute_band_powers(const std::string& label, const Periodogram& p) {
  if (p.freqs_hz.size() != p.psd.size()) {
    throw std::runtime_error("compute_band_powers: psd/frequency size mismatch");
  }

  BandPowerSnapshot s;
  s.label = label;

  const double df = bin_width(p);
  const auto& bands = standard_bands();
  for (size_t i = 0; i < p.freqs_hz.size(); ++i) {
    const double f = p.freqs_hz[i];
    const double power = p.psd[i] * df;
    if (!std::isfinite(power)) continue;
    for (const auto& b : bands) {
      if (f >= b.fmin_hz && f < b.fmax_hz) {
        s.bands[band_index(b.band)].absolute += power;
        break;
      }
    }
  }

  normalize_band_powers(&s);
  return s;
}

bool aggregate_band_powers(const AggregateDefinition& def,
                           const std::vector<BandPowerSnapshot>& channels,
                           BandPowerSnapshot* out) {
  if (!out) return false;

  BandPowerSnapshot agg;
  agg.label = def.label;
  size_t present = 0;
  for (const auto& member : def.members) {
    auto it = std::find_if(channels.begin(), channels.end(),
                           [&](const BandPowerSnapshot& s) { return s.label == member; });
    if (it == channels.end()) continue;
    ++present;
    for (size_t b = 0; b < kNumBands; ++b) {
      agg.bands[b].absolute += it->bands[b].absolute;
    }
  }
  if (present == 0) return false;

  normalize_band_powers(&agg);
  *out = agg;
  return true;
}

std::vector<AggregateDefinition> default_aggregates(const std::vector<std::string>& labels) {
  AggregateDefinition all{"ALL", {}};
  AggregateDefinition left{"LEFT", {}};
  AggregateDefinition right{"RIGHT", {}};
  for (const auto& l : labels) {
    if (is_aux_label(l)) continue;
    all.members.push_back(l);
    const Hemisphere h = infer_hemisphere(l);
    if (h == Hemisphere::Left) left.members.push_back(l);
    if (h == Hemisphere::Right) right.members.push_back(l);
  }

  std::vector<AggregateDefinition> out;
  out.push_back(all);
  out.push_back({"PAIR_TP9_10", {"TP9", "TP10"}});
  out.push_back({"PAIR_AF7_8", {"AF7", "AF8"}});
  out.push_back(left);
  out.push_back(right);
  return out;
}

static TimestampMs sec_to_ms(double sec) {
  if (!std::isfinite(sec) || sec < 0.0) return 0;
  return static_cast<TimestampMs>(std::llround(sec * 1000.0));
}

BandHistory::BandHistory(double window_sec, double smoothing_sec)
    : window_ms_(sec_to_ms(window_sec)), smoothing_ms_(sec_to_ms(smoothing_sec)) {}

bool BandHistory::append(TimestampMs t, double v) {
  if (!points_.empty() && t < points_.back().t) return false;
  if (!std::isfinite(v)) v = 0.0;

  points_.push_back({t, v});
  while (!points_.empty() && points_.front().t < t - window_ms_) {
    points_.pop_front();
  }

  const TimestampMs smooth_start = t - smoothing_ms_;
  double acc = 0.0;
  size_t n = 0;
  for (const auto& p : points_) {
    if (p.t < smooth_start) continue;
    acc += p.v;
    ++n;
  }
  smoothed_ = (n > 0) ? acc / static_cast<double>(n) : v;
  return true;
}

void BandHistory::clear() {
  points_.clear();
  smoothed_ = 0.0;
}

BandPowerAggregator::BandPowerAggregator(BandPowerOptions opt) : opt_(std::move(opt)) {
  if (!(opt_.history_window_sec > 0.0)) {
    throw std::runtime_error("BandPowerAggregator: history_window_sec must be > 0");
  }
  if (!(opt_.smoothing_window_sec > 0.0)) {
    throw std::runtime_error("BandPowerAggregator: smoothing_window_sec must be > 0");
  }
}

bool BandPowerAggregator::update(const std::vector<BandPowerSnapshot>& channel_snapshots,
                                 TimestampMs now) {
  std::vector<BandPowerSnapshot> all = channel_snapshots;

  std::vector<AggregateDefinition> defs = opt_.aggregates;
  if (defs.empty() && opt_.use_default_aggregates) {
    std::vector<std::string> labels;
    labels.reserve(channel_snapshots.size());
    for (const auto& s : channel_snapshots) labels.push_back(s.label);
    defs = default_aggregates(labels);
  }
  for (const auto& def : defs) {
    BandPowerSnapshot agg;
    if (aggregate_band_powers(def, channel_snapshots, &agg)) all.push_back(agg);
  }
  snapshots_ = all;

  std::map<std::string, Signature> sigs;
  for (const auto& s : all) {
    Signature sig{};
    for (size_t b = 0; b < kNumBands; ++b) sig[b] = s.bands[b].relative;
    sigs[s.label] = sig;
  }
  if (sigs == last_signatures_) return false;
  last_signatures_ = sigs;

  for (const auto& s : all) {
    auto it = histories_.find(s.label);
    if (it == histories_.end()) {
      std::array<BandHistory, kNumBands> h;
      for (auto& bh : h) bh = BandHistory(opt_.history_window_sec, opt_.smoothing_window_sec);
      it = histories_.emplace(s.label, h).first;
    }
    for (size_t b = 0; b < kNumBands; ++b) {
      it->second[b].append(now, s.bands[b].relative);
    }
  }

  for (auto it = histories_.begin(); it != histories_.end();) {
    if (sigs.find(it->first) == sigs.end()) {
      it = histories_.erase(it);
    } else {
      ++it;
    }
  }
  return true;
}

const BandHistory* BandPowerAggregator::history(const std::string& label, Band band) const {
  auto it = histories_.find(label);
  if (it == histories_.end()) return nullptr;
  return &it->second[band_index(band)];
}

std::vector<std::string> BandPowerAggregator::history_labels() const {
  std::vector<std::string> out;
  out.reserve(histories_.size());
  for (const auto& kv : histories_) out.push_back(kv.first);
  return out;
}

void BandPowerAggregator::clear() {
  snapshots_.clear();
  last_signatures_.clear();
  histories_.clear();
}

} // namespace biostream
