#pragma once

#include "biostream/smoother.hpp"
#include "biostream/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace biostream {

// Why a vitals estimate is (or is not) available.
enum class VitalsReason { Ok, DcZero, AcZero, PiNan, PiLow, NoSignal, NoData };

// "OK", "DC_ZERO", "AC_ZERO", "PI_NAN", "PI_LOW", "NO_SIGNAL", "NO_DATA".
const char* vitals_reason_name(VitalsReason r);

enum class Spo2Model {
  Linear,     // intercept - slope * ratio
  Quadratic,  // -45.060 r^2 + 30.354 r + 94.845
};

// Which optical channel plays which role.
struct PpgSensorMapping {
  int ambient_channel{0};
  int ir_channel{1};
  int red_channel{2};
};

struct PpgVitalsOptions {
  PpgSensorMapping mapping;

  // Labels (or the role names "IR", "RED", "AMBIENT") to consider.
  // Empty means every channel is enabled.
  std::vector<std::string> enabled_labels;

  // Analysis window for heart rate, pulse quality and SpO2.
  double window_sec{8.0};

  // DC: 4th-order low-pass. AC: high-pass then low-pass.
  double dc_lowpass_hz{0.5};
  double ac_low_hz{0.5};
  double ac_high_hz{4.0};

  double min_perfusion_index{0.005};

  Spo2Model spo2_model{Spo2Model::Linear};
  double spo2_intercept{110.0};
  double spo2_slope{25.0};
  double spo2_min{80.0};
  double spo2_max{100.0};
  double spo2_ema_alpha{0.2};

  int min_bpm{35};
  int max_bpm{220};
  double min_peak_spacing_sec{0.4};
  double peak_mad_gain{1.25};

  // Heart rate, quality and cardiogram need at least this much signal.
  double min_signal_sec{3.0};

  int64_t pulse_debounce_ms{10000};

  // Peak-to-peak segments concatenated into the cardiogram.
  size_t cardiogram_segments{5};

  // Upper bound on the combined PPG trace (samples).
  size_t trace_window{1024};
};

// Copy of one PPG channel's buffered samples (oldest first).
struct PpgChannelView {
  int channel_id{0};
  std::string label;
  std::vector<double> samples;
};

// Detrend (mean removal) followed by the AC band-pass.
std::vector<double> pulse_bandpass(const std::vector<double>& x, double fs_hz, const PpgVitalsOptions& opt);

// Both fields are NaN when the window holds a non-finite sample.
struct PerfusionResult {
  double dc_mean{0.0};       // |mean| of the low-passed window
  double ac_amplitude{0.0};  // (p95 - p05) / 2 of the band-passed window
};

PerfusionResult compute_perfusion(const std::vector<double>& window, double fs_hz, const PpgVitalsOptions& opt);

// Linear or quadratic ratio-of-ratios model, clamped to [spo2_min, spo2_max].
double spo2_from_ratio(double ratio, const PpgVitalsOptions& opt);

struct Spo2Result {
  bool ok{false};
  VitalsReason reason{VitalsReason::NoData};
  std::optional<double> spo2;
  std::optional<double> ratio;
  std::optional<double> perfusion_index_ir;
  std::optional<double> perfusion_index_red;
  std::string ir_label;
  std::string red_label;
};

// Ratio-of-ratios SpO2 over the last window of the IR and red channels.
// nullopt when either channel is missing or shorter than the window.
std::optional<Spo2Result> estimate_spo2(const std::vector<PpgChannelView>& channels,
                                        double fs_hz,
                                        const PpgVitalsOptions& opt);

// Adaptive-threshold peak picking (median + gain * MAD) with a minimum
// spacing; a larger local maximum inside the spacing replaces the last peak.
std::vector<size_t> find_pulse_peaks(const std::vector<double>& x, double fs_hz, const PpgVitalsOptions& opt);

// 60 * fs / median peak interval, rounded. nullopt when the signal is too
// short, fewer than 2 peaks are found, or the rate is out of range.
std::optional<int> compute_heart_rate_bpm(const std::vector<double>& window,
                                          double fs_hz,
                                          const PpgVitalsOptions& opt);

// p95 - p05 of the band-passed trailing window; nullopt if not positive.
std::optional<double> pulse_quality(const std::vector<double>& samples,
                                    double fs_hz,
                                    const PpgVitalsOptions& opt);

struct PulseSelection {
  int channel_id{-1};
  std::string label;
  double quality{0.0};
  TimestampMs selected_at{0};

  bool valid() const { return channel_id >= 0; }
};

struct PulseResolution {
  std::optional<size_t> selected;  // index into the channel list
  double quality{0.0};
  PulseSelection next;
};

// Pick the pulse channel with the best quality, keeping the previous choice
// while it still has samples and the debounce interval has not elapsed.
PulseResolution resolve_pulse_selection(const std::vector<PpgChannelView>& channels,
                                        double fs_hz,
                                        const PulseSelection& prev,
                                        TimestampMs now,
                                        const PpgVitalsOptions& opt);

// Channels matching opt.enabled_labels (all when the list is empty).
std::vector<PpgChannelView> filter_enabled_channels(const std::vector<PpgChannelView>& channels,
                                                    const PpgVitalsOptions& opt);

// Drop the ambient channel.
std::vector<PpgChannelView> exclude_ambient(const std::vector<PpgChannelView>& channels,
                                            const PpgSensorMapping& mapping);

// Sample-wise average over the last min(length) samples of every non-empty
// channel, capped at max_samples. Empty when no channel has data.
std::vector<double> build_combined_ppg(const std::vector<PpgChannelView>& channels, size_t max_samples);

// Band-passed signal between the last few peaks, concatenated.
std::vector<double> build_cardiogram(const std::vector<double>& window, double fs_hz, const PpgVitalsOptions& opt);

// State carried from one vitals update to the next.
struct PpgVitalsState {
  PulseSelection selection;
  ExponentialSmoother spo2_ema{0.2};

  void reset() {
    selection = PulseSelection{};
    spo2_ema.reset();
  }
};

struct HeartVitals {
  std::optional<int> heart_rate_bpm;
  std::optional<double> spo2;
  std::optional<double> ratio;
  std::optional<double> perfusion_index_ir;
  std::optional<double> perfusion_index_red;

  bool ok{false};
  VitalsReason reason{VitalsReason::NoData};

  std::string ir_label;
  std::string red_label;

  std::optional<int> pulse_channel_id;
  std::string pulse_channel_label;
  std::optional<double> pulse_quality;

  std::vector<double> combined_ppg;
  std::vector<double> cardiogram;
};

class PpgVitalsEstimator {
public:
  explicit PpgVitalsEstimator(double fs_hz, PpgVitalsOptions opt = {});

  // One vitals update over copies of the buffered channels. Channels with an
  // id outside 0..2 or without samples are ignored.
  HeartVitals compute(const std::vector<PpgChannelView>& channels,
                      PpgVitalsState* state,
                      TimestampMs now) const;

  double fs_hz() const { return fs_hz_; }
  const PpgVitalsOptions& options() const { return opt_; }

private:
  double fs_hz_{0.0};
  PpgVitalsOptions opt_;
};

} // namespace biostream
