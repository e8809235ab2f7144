#pragma once

#include "biostream/types.hpp"

#include <array>
#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace biostream {

enum class Band { Delta = 0, Theta, Alpha, Beta, Gamma };

constexpr size_t kNumBands = 5;

// Half-open frequency range [fmin_hz, fmax_hz).
struct BandDefinition {
  Band band{Band::Delta};
  std::string name;
  double fmin_hz{0.0};
  double fmax_hz{0.0};
};

// delta 0.5-4, theta 4-8, alpha 8-12, beta 12-30, gamma 30-50 Hz.
const std::array<BandDefinition, kNumBands>& standard_bands();

inline size_t band_index(Band b) { return static_cast<size_t>(b); }
const char* band_name(Band b);

struct BandPower {
  double absolute{0.0};
  double relative{0.0};
};

// Band powers of one channel (or synthetic aggregate) at one instant.
//
// Invariant: relative values sum to 1 when total > 0, otherwise all are 0.
struct BandPowerSnapshot {
  std::string label;
  std::array<BandPower, kNumBands> bands{};
  double total{0.0};

  const BandPower& at(Band b) const { return bands[band_index(b)]; }
};

// Integrate a periodogram into the standard bands.
// Bin width is the first frequency gap; bins outside every band are ignored.
BandPowerSnapshot compute_band_powers(const std::string& label, const Periodogram& p);

// Recompute total and relative values from the absolute values.
void normalize_band_powers(BandPowerSnapshot* s);

// A synthetic channel whose absolute band powers are the sum of its members.
struct AggregateDefinition {
  std::string label;
  std::vector<std::string> members;
};

// Sum member absolutes, then renormalize. Members not present in `channels`
// are skipped; returns false (and leaves *out untouched) if none is present.
bool aggregate_band_powers(const AggregateDefinition& def,
                           const std::vector<BandPowerSnapshot>& channels,
                           BandPowerSnapshot* out);

// ALL (non-AUX channels), PAIR_TP9_10, PAIR_AF7_8, LEFT and RIGHT
// (hemispheres inferred from the labels; AUX inputs excluded).
std::vector<AggregateDefinition> default_aggregates(const std::vector<std::string>& labels);

struct BandHistoryPoint {
  TimestampMs t{0};
  double v{0.0};
};

// Rolling, time-bounded history of one (channel, band) relative power.
class BandHistory {
public:
  BandHistory() = default;
  BandHistory(double window_sec, double smoothing_sec);

  // Appends (t, v), evicts points with t < t_latest - window and recomputes
  // the smoothed value. Returns false (and ignores the point) if t is older
  // than the latest stored point.
  bool append(TimestampMs t, double v);

  const std::deque<BandHistoryPoint>& points() const { return points_; }
  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }

  // Mean of points with t >= latest.t - smoothing window (0 when empty).
  double smoothed() const { return smoothed_; }

  void clear();

private:
  TimestampMs window_ms_{120000};
  TimestampMs smoothing_ms_{10000};
  std::deque<BandHistoryPoint> points_;
  double smoothed_{0.0};
};

struct BandPowerOptions {
  double history_window_sec{120.0};
  double smoothing_window_sec{10.0};

  // When empty and use_default_aggregates is set, default_aggregates() of the
  // current channel labels is used.
  std::vector<AggregateDefinition> aggregates;
  bool use_default_aggregates{true};
};

// Per-tick band power bookkeeping: aggregates, change detection and history.
class BandPowerAggregator {
public:
  explicit BandPowerAggregator(BandPowerOptions opt = {});

  // Feed the per-channel snapshots of this tick (aggregates are added here).
  //
  // If no label's relative-power signature changed and the label set is the
  // same as last time, histories are left untouched and false is returned.
  // Otherwise every active label appends one point per band at `now`,
  // histories of labels that disappeared are dropped, and true is returned.
  bool update(const std::vector<BandPowerSnapshot>& channel_snapshots, TimestampMs now);

  // Channel snapshots followed by aggregate snapshots from the last update().
  const std::vector<BandPowerSnapshot>& snapshots() const { return snapshots_; }

  const BandHistory* history(const std::string& label, Band band) const;
  std::vector<std::string> history_labels() const;

  const BandPowerOptions& options() const { return opt_; }

  void clear();

private:
  using Signature = std::array<double, kNumBands>;

  BandPowerOptions opt_;
  std::vector<BandPowerSnapshot> snapshots_;
  std::map<std::string, Signature> last_signatures_;
  std::map<std::string, std::array<BandHistory, kNumBands>> histories_;
};

} // namespace biostream
