#pragma once

#include "biostream/artifacts.hpp"
#include "biostream/bandpower.hpp"
#include "biostream/channel_table.hpp"
#include "biostream/config.hpp"
#include "biostream/periodogram_averager.hpp"
#include "biostream/ppg_vitals.hpp"
#include "biostream/sample_buffer.hpp"
#include "biostream/spectrogram.hpp"
#include "biostream/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace biostream {

struct EegChannelOutput {
  int index{0};
  std::string label;
  size_t buffered_samples{0};
  std::optional<Periodogram> averaged_periodogram;
  std::vector<SpectrogramSlice> spectrogram_slices;
  ArtifactReport artifacts;
};

struct BandSeries {
  std::string label;
  Band band{Band::Delta};
  std::vector<BandHistoryPoint> points;
  double smoothed{0.0};
};

struct RawTrace {
  int index{0};
  std::string label;
  std::vector<double> samples;
};

// Everything a consumer sees after one tick. All members are copies.
struct TickResult {
  TimestampMs now{0};

  // Which stages ran during this tick.
  bool computed{false};
  bool bandpower_changed{false};
  bool vitals_updated{false};
  bool raw_published{false};

  std::vector<EegChannelOutput> eeg;
  std::vector<BandPowerSnapshot> band_snapshots;
  std::vector<BandSeries> band_history;

  // Latest vitals (nullopt until the first vitals update).
  std::optional<HeartVitals> vitals;

  // Filled only when raw_published is set.
  std::vector<RawTrace> eeg_traces;
  std::vector<RawTrace> ppg_traces;
};

// Owns every buffer and every piece of cross-tick state.
//
// ingest() only appends; tick() runs the stages whose interval elapsed.
// Single threaded: callers serialize ingest()/tick().
class ProcessingCore {
public:
  // Validates the configuration (throws std::runtime_error).
  explicit ProcessingCore(PipelineConfig cfg);

  void apply_channel_map(const std::vector<std::string>& labels);

  void ingest(const EegPacket& packet);

  // Returns false when the packet was ignored (channel outside 0..2).
  bool ingest(const PpgPacket& packet);

  TickResult tick(TimestampMs now);

  // Spectrogram of the named EEG channels (all channels when empty).
  SpectrogramImage build_spectrogram(const std::vector<std::string>& labels, TimestampMs now);

  // The last auto_export_ms of every EEG channel (empty when disabled).
  std::vector<RawTrace> export_window() const;

  // Drop all samples and cross-tick state (e.g. after a disconnect).
  void reset();

  const PipelineConfig& config() const { return cfg_; }
  const ChannelTable& channels() const { return table_; }
  size_t stft_invocations() const { return spectrogram_.stft_invocations(); }

private:
  struct EegChannelState {
    EegChannelState(size_t capacity, size_t averager_count, double spectrogram_window_sec)
        : buffer(capacity), averager(averager_count), slices(spectrogram_window_sec) {}

    SampleBuffer buffer;
    PeriodogramAverager averager;
    std::optional<Periodogram> averaged;
    SpectrogramSliceCache slices;
    ArtifactReport artifacts;
    uint64_t last_computed_total{0};
  };

  struct PpgChannelState {
    explicit PpgChannelState(size_t capacity) : buffer(capacity) {}

    std::string label;
    SampleBuffer buffer;
  };

  static bool due(const std::optional<TimestampMs>& last, int64_t interval_ms, TimestampMs now);

  void run_spectral_stage(TimestampMs now, TickResult* out);
  void run_vitals_stage(TimestampMs now);
  void publish_raw(TickResult* out) const;
  void fill_outputs(TickResult* out) const;

  EegChannelState& eeg_channel(int index);

  PipelineConfig cfg_;
  ChannelTable table_;
  std::map<int, EegChannelState> eeg_;
  std::map<int, PpgChannelState> ppg_;

  BandPowerAggregator bands_;
  PpgVitalsEstimator vitals_;
  PpgVitalsState vitals_state_;
  std::optional<HeartVitals> last_vitals_;
  SpectrogramBuilder spectrogram_;

  std::optional<TimestampMs> last_compute_;
  std::optional<TimestampMs> last_vitals_at_;
  std::optional<TimestampMs> last_republish_;
};

} // namespace biostream
