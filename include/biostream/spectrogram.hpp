#pragma once

#include "biostream/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace biostream {

// Short-time Fourier transform (STFT) / spectrogram utilities.
//
// We compute a per-frame, one-sided power spectral density (PSD) using a Hann
// window. This is similar to Welch's method but without averaging across
// frames.

struct StftOptions {
  // Segment length in samples.
  // If 0, the implementation will choose a minimum reasonable value.
  size_t nperseg{0};

  // Hop size in samples (advance between successive frames).
  // If 0, defaults to nperseg/2.
  size_t hop{0};

  // FFT size.
  // If 0, uses the next power of two >= nperseg.
  size_t nfft{0};

  // Subtract the mean of the whole signal once before framing.
  bool detrend_global{true};

  // If true, subtract the mean of each frame before windowing.
  bool detrend_mean{false};

  // Keep only bins <= max_freq_hz (0 keeps all bins).
  double max_freq_hz{0.0};
};

struct StftResult {
  std::vector<double> times_sec;   // length = n_frames (center time of each frame)
  std::vector<double> freqs_hz;    // length = n_freq (one-sided)

  // Row-major [frame][freq] as a flat array of PSD values.
  // size = n_frames * n_freq
  std::vector<double> psd;

  size_t n_frames{0};
  size_t n_freq{0};

  double at(size_t frame, size_t freq) const {
    return psd[frame * n_freq + freq];
  }
};

// Compute a one-sided spectrogram (PSD per frame).
StftResult stft_spectrogram_psd(const std::vector<double>& x,
                                double fs_hz,
                                const StftOptions& opt);

struct SpectrogramOptions {
  // Display window (also the slice cache retention).
  double window_sec{300.0};
  double max_freq_hz{50.0};

  // nperseg = window samples clamped to [min_nperseg, max_nperseg].
  size_t min_nperseg{256};
  size_t max_nperseg{2048};

  // hop = max(min_hop, nperseg / hop_divisor).
  size_t min_hop{32};
  size_t hop_divisor{16};

  // nfft = max(min_nfft, next_power_of_two(4 * nperseg)).
  size_t min_nfft{8192};

  // dB = 10*log10(max(power, db_floor_power)).
  double db_floor_power{1e-12};

  // Color domain percentiles and the fallback used when they degenerate.
  double lower_quantile{0.05};
  double upper_quantile{0.95};
  double fallback_vmin_db{-120.0};
  double fallback_vmax_db{-40.0};

  // Cached slices needed before a fresh STFT is skipped.
  size_t min_cached_slices{2};

  // Consecutive slices further apart than this start a new segment.
  double gap_sec{2.0};

  // Raster rows per channel (0 = one row per frequency bin).
  size_t raster_rows_per_channel{0};
};

struct StftPlan {
  size_t nperseg{0};
  size_t hop{0};
  size_t nfft{0};
};

// Frame layout for a display window of window_samples when `available`
// samples are buffered. nullopt when fewer than min_nperseg samples exist.
std::optional<StftPlan> plan_stft(size_t window_samples,
                                  size_t available,
                                  const SpectrogramOptions& opt);

// One cached periodogram column, restricted to the display band.
struct SpectrogramSlice {
  std::vector<double> freqs_hz;
  std::vector<double> psd;
  TimestampMs t{0};
};

// Time-ordered per-channel slice history, bounded by the display window.
class SpectrogramSliceCache {
public:
  explicit SpectrogramSliceCache(double window_sec = 300.0);

  // Appends a slice and drops slices older than slice.t - window.
  // Returns false (nothing stored) when the slice is older than the latest
  // one or carries the same data as the latest one.
  bool push(SpectrogramSlice slice);

  // Slices with now - window <= t <= now.
  std::vector<SpectrogramSlice> in_window(TimestampMs now) const;

  const std::deque<SpectrogramSlice>& slices() const { return slices_; }
  size_t size() const { return slices_.size(); }
  void clear() { slices_.clear(); }

private:
  TimestampMs window_ms_{300000};
  std::deque<SpectrogramSlice> slices_;
};

// Indices i > 0 where times_ms[i] - times_ms[i-1] > min_gap_ms.
std::vector<size_t> find_gap_starts(const std::vector<TimestampMs>& times_ms, TimestampMs min_gap_ms);

enum class SpectrogramSource { None, CachedSlices, Stft };

const char* spectrogram_source_name(SpectrogramSource s);

// dB grid of one channel, row-major [frame][freq].
struct ChannelSpectrogram {
  std::string label;
  SpectrogramSource source{SpectrogramSource::None};
  std::vector<TimestampMs> times_ms;
  std::vector<double> freqs_hz;
  std::vector<double> db;
  size_t n_frames{0};
  size_t n_freq{0};
  std::vector<size_t> gap_starts;

  double at(size_t frame, size_t freq) const { return db[frame * n_freq + freq]; }
  bool empty() const { return n_frames == 0 || n_freq == 0; }
};

struct ColorDomain {
  double vmin_db{-120.0};
  double vmax_db{-40.0};
  bool fallback{true};
};

// Robust color domain over every dB value of every channel.
ColorDomain compute_color_domain(const std::vector<ChannelSpectrogram>& channels,
                                 const SpectrogramOptions& opt);

struct SpectrogramImage {
  std::vector<ChannelSpectrogram> channels;
  ColorDomain domain;
  SpectrogramSource source{SpectrogramSource::None};

  // Channels stacked top to bottom; within a channel the top row is the
  // highest frequency. Row-major, width*height.
  int width{0};
  int height{0};
  std::vector<RGB> pixels;
};

// Rasterize channels with the palette. Columns past a channel's last frame
// stay black. An image without frames is 0x0.
void rasterize_spectrogram(SpectrogramImage* image, const SpectrogramOptions& opt);

struct SpectrogramInput {
  std::string label;
  std::vector<double> samples;                // raw samples, oldest first, ending at `now`
  std::vector<SpectrogramSlice> cached_slices;
};

// Builds multi-channel spectrogram images, reusing cached per-tick slices
// when enough of them cover the window and falling back to a fresh STFT.
class SpectrogramBuilder {
public:
  explicit SpectrogramBuilder(double fs_hz, SpectrogramOptions opt = {});

  SpectrogramImage build(const std::vector<SpectrogramInput>& inputs, TimestampMs now);

  // Number of STFT computations performed so far.
  size_t stft_invocations() const { return stft_invocations_; }

  const SpectrogramOptions& options() const { return opt_; }

private:
  ChannelSpectrogram from_slices(const std::string& label,
                                 const std::vector<SpectrogramSlice>& slices) const;
  ChannelSpectrogram from_samples(const std::string& label,
                                  const std::vector<double>& samples,
                                  TimestampMs now);

  double fs_hz_{0.0};
  SpectrogramOptions opt_;
  size_t stft_invocations_{0};
};

} // namespace biostream
