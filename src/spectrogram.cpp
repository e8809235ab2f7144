#include "biostream/spectrogram.hpp"

#include "biostream/colormap.hpp"
#include "biostream/fft.hpp"
#include "biostream/robust_stats.hpp"
#include "biostream/sample_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace biostream {

static double mean_of_segment(const std::vector<double>& x, size_t start, size_t n) {
  double s = 0.0;
  for (size_t i = 0; i < n; ++i) s += x[start + i];
  return s / static_cast<double>(n);
}

StftResult stft_spectrogram_psd(const std::vector<double>& x_in,
                                double fs_hz,
                                const StftOptions& opt_in) {
  if (fs_hz <= 0.0) throw std::runtime_error("stft_spectrogram_psd: fs_hz must be > 0");
  if (x_in.empty()) throw std::runtime_error("stft_spectrogram_psd: input signal is empty");

  StftOptions opt = opt_in;
  if (opt.nperseg == 0) opt.nperseg = 256;
  if (opt.nperseg < 8) opt.nperseg = 8;
  if (opt.nperseg > x_in.size()) opt.nperseg = x_in.size();
  if (opt.hop == 0) opt.hop = opt.nperseg / 2;
  if (opt.hop == 0) opt.hop = 1;

  const size_t nfft = (opt.nfft == 0) ? next_power_of_two(opt.nperseg) : opt.nfft;
  if (!is_power_of_two(nfft)) {
    throw std::runtime_error("stft_spectrogram_psd: nfft must be a power of two");
  }
  if (nfft < opt.nperseg) {
    throw std::runtime_error("stft_spectrogram_psd: nfft must be >= nperseg");
  }

  std::vector<double> x = x_in;
  if (opt.detrend_global) {
    const double m = mean_of_segment(x, 0, x.size());
    for (double& v : x) v -= m;
  }

  size_t nfreq = nfft / 2 + 1;
  if (opt.max_freq_hz > 0.0) {
    size_t keep = 0;
    while (keep < nfreq && bin_frequency(keep, nfft, fs_hz) <= opt.max_freq_hz) ++keep;
    nfreq = std::max<size_t>(1, keep);
  }

  const std::vector<double> window = hann_window(opt.nperseg);
  double U = 0.0;
  for (double wi : window) U += wi * wi;
  if (U <= 0.0) throw std::runtime_error("stft_spectrogram_psd: invalid window normalization");

  size_t nframes = 0;
  for (size_t start = 0; start + opt.nperseg <= x.size(); start += opt.hop) {
    ++nframes;
  }
  if (nframes == 0) throw std::runtime_error("stft_spectrogram_psd: not enough samples for one frame");

  StftResult out;
  out.n_frames = nframes;
  out.n_freq = nfreq;
  out.times_sec.resize(nframes);
  out.freqs_hz.resize(nfreq);
  out.psd.assign(nframes * nfreq, 0.0);

  for (size_t k = 0; k < nfreq; ++k) {
    out.freqs_hz[k] = bin_frequency(k, nfft, fs_hz);
  }

  std::vector<double> frame(opt.nperseg);
  std::vector<double> psd;
  size_t fi = 0;
  for (size_t start = 0; start + opt.nperseg <= x.size(); start += opt.hop) {
    double m = 0.0;
    if (opt.detrend_mean) m = mean_of_segment(x, start, opt.nperseg);
    for (size_t i = 0; i < opt.nperseg; ++i) {
      frame[i] = (x[start + i] - m) * window[i];
    }

    one_sided_psd(frame, nfft, fs_hz, U, &psd);
    std::copy(psd.begin(), psd.begin() + static_cast<std::ptrdiff_t>(nfreq),
              out.psd.begin() + static_cast<std::ptrdiff_t>(fi * nfreq));

    // Center time (seconds)
    out.times_sec[fi] = (static_cast<double>(start) + 0.5 * static_cast<double>(opt.nperseg)) / fs_hz;
    ++fi;
  }

  return out;
}

std::optional<StftPlan> plan_stft(size_t window_samples,
                                  size_t available,
                                  const SpectrogramOptions& opt) {
  const size_t lo = std::max<size_t>(1, opt.min_nperseg);
  const size_t hi = std::max(lo, opt.max_nperseg);

  StftPlan plan;
  plan.nperseg = std::min(std::max(window_samples, lo), hi);
  plan.nperseg = std::min(plan.nperseg, available);
  if (plan.nperseg < lo) return std::nullopt;

  const size_t divisor = std::max<size_t>(1, opt.hop_divisor);
  plan.hop = std::max(opt.min_hop, plan.nperseg / divisor);
  if (plan.hop == 0) plan.hop = 1;

  plan.nfft = std::max(opt.min_nfft, next_power_of_two(4 * plan.nperseg));
  plan.nfft = next_power_of_two(plan.nfft);
  return plan;
}

static TimestampMs sec_to_ms(double sec) {
  if (!std::isfinite(sec) || sec <= 0.0) return 0;
  return static_cast<TimestampMs>(std::llround(sec * 1000.0));
}

SpectrogramSliceCache::SpectrogramSliceCache(double window_sec) : window_ms_(sec_to_ms(window_sec)) {
  if (window_ms_ <= 0) throw std::runtime_error("SpectrogramSliceCache: window_sec must be > 0");
}

bool SpectrogramSliceCache::push(SpectrogramSlice slice) {
  if (slice.freqs_hz.size() != slice.psd.size()) {
    throw std::runtime_error("SpectrogramSliceCache::push: psd/frequency size mismatch");
  }
  if (!slices_.empty()) {
    const SpectrogramSlice& last = slices_.back();
    if (slice.t < last.t) return false;
    // Unchanged column (channel not recomputed since the last tick).
    if (last.psd == slice.psd && last.freqs_hz == slice.freqs_hz) return false;
  }

  const TimestampMs t = slice.t;
  slices_.push_back(std::move(slice));
  while (!slices_.empty() && (t - slices_.front().t) > window_ms_) {
    slices_.pop_front();
  }
  return true;
}

std::vector<SpectrogramSlice> SpectrogramSliceCache::in_window(TimestampMs now) const {
  std::vector<SpectrogramSlice> out;
  for (const auto& s : slices_) {
    if (s.t < now - window_ms_ || s.t > now) continue;
    out.push_back(s);
  }
  return out;
}

std::vector<size_t> find_gap_starts(const std::vector<TimestampMs>& times_ms, TimestampMs min_gap_ms) {
  std::vector<size_t> out;
  for (size_t i = 1; i < times_ms.size(); ++i) {
    if (times_ms[i] - times_ms[i - 1] > min_gap_ms) out.push_back(i);
  }
  return out;
}

const char* spectrogram_source_name(SpectrogramSource s) {
  switch (s) {
    case SpectrogramSource::None: return "none";
    case SpectrogramSource::CachedSlices: return "cached_slices";
    case SpectrogramSource::Stft: return "stft";
  }
  return "unknown";
}

static double to_db(double power, double floor_power) {
  const double p = (std::isfinite(power) && power > floor_power) ? power : floor_power;
  return 10.0 * std::log10(p);
}

ColorDomain compute_color_domain(const std::vector<ChannelSpectrogram>& channels,
                                 const SpectrogramOptions& opt) {
  ColorDomain d;
  d.vmin_db = opt.fallback_vmin_db;
  d.vmax_db = opt.fallback_vmax_db;
  d.fallback = true;

  std::vector<double> all;
  for (const auto& ch : channels) {
    for (double v : ch.db) {
      if (std::isfinite(v)) all.push_back(v);
    }
  }
  if (all.empty()) return d;

  const double lo = quantile_inplace(&all, opt.lower_quantile);
  const double hi = quantile_inplace(&all, opt.upper_quantile);
  if (!std::isfinite(lo) || !std::isfinite(hi) || !(hi > lo)) return d;

  d.vmin_db = lo;
  d.vmax_db = hi;
  d.fallback = false;
  return d;
}

void rasterize_spectrogram(SpectrogramImage* image, const SpectrogramOptions& opt) {
  if (!image) return;

  size_t width = 0;
  for (const auto& ch : image->channels) width = std::max(width, ch.n_frames);
  if (width == 0) {
    // Nothing to draw.
    image->width = 0;
    image->height = 0;
    image->pixels.clear();
    return;
  }

  std::vector<size_t> rows(image->channels.size(), 0);
  size_t height = 0;
  for (size_t c = 0; c < image->channels.size(); ++c) {
    const auto& ch = image->channels[c];
    size_t r = (opt.raster_rows_per_channel > 0) ? opt.raster_rows_per_channel : ch.n_freq;
    if (r == 0) r = 1;
    rows[c] = r;
    height += r;
  }
  if (height == 0) height = 1;

  image->width = static_cast<int>(width);
  image->height = static_cast<int>(height);
  image->pixels.assign(width * height, RGB{0, 0, 0});

  const double range = image->domain.vmax_db - image->domain.vmin_db;
  const double inv_range = (range > 0.0) ? (1.0 / range) : 0.0;

  size_t y0 = 0;
  for (size_t c = 0; c < image->channels.size(); ++c) {
    const auto& ch = image->channels[c];
    const size_t nrows = rows[c];
    if (!ch.empty()) {
      for (size_t r = 0; r < nrows; ++r) {
        // Top row = highest frequency.
        size_t k = (nrows == ch.n_freq) ? r : (r * ch.n_freq) / nrows;
        k = std::min(k, ch.n_freq - 1);
        const size_t freq = ch.n_freq - 1 - k;
        RGB* out_row = &image->pixels[(y0 + r) * width];
        for (size_t f = 0; f < ch.n_frames; ++f) {
          const double t = (ch.at(f, freq) - image->domain.vmin_db) * inv_range;
          out_row[f] = colormap_viridis(t);
        }
      }
    }
    y0 += nrows;
  }
}

SpectrogramBuilder::SpectrogramBuilder(double fs_hz, SpectrogramOptions opt)
    : fs_hz_(fs_hz), opt_(std::move(opt)) {
  if (!(fs_hz_ > 0.0)) throw std::runtime_error("SpectrogramBuilder: fs_hz must be > 0");
  if (!(opt_.window_sec > 0.0)) throw std::runtime_error("SpectrogramBuilder: window_sec must be > 0");
  if (!(opt_.max_freq_hz > 0.0)) throw std::runtime_error("SpectrogramBuilder: max_freq_hz must be > 0");
  if (opt_.min_nperseg == 0 || opt_.max_nperseg < opt_.min_nperseg) {
    throw std::runtime_error("SpectrogramBuilder: invalid nperseg range");
  }
}

ChannelSpectrogram SpectrogramBuilder::from_slices(const std::string& label,
                                                   const std::vector<SpectrogramSlice>& slices) const {
  ChannelSpectrogram ch;
  ch.label = label;
  ch.source = SpectrogramSource::CachedSlices;

  // Frequency axis of the first slice, cut at the display maximum.
  const SpectrogramSlice& first = slices.front();
  for (double f : first.freqs_hz) {
    if (f > opt_.max_freq_hz) break;
    ch.freqs_hz.push_back(f);
  }
  ch.n_freq = ch.freqs_hz.size();
  if (ch.n_freq == 0) return ch;

  for (const auto& s : slices) {
    if (s.psd.size() < ch.n_freq) continue;
    ch.times_ms.push_back(s.t);
    for (size_t k = 0; k < ch.n_freq; ++k) {
      ch.db.push_back(to_db(s.psd[k], opt_.db_floor_power));
    }
  }
  ch.n_frames = ch.times_ms.size();
  ch.gap_starts = find_gap_starts(ch.times_ms, sec_to_ms(opt_.gap_sec));
  return ch;
}

ChannelSpectrogram SpectrogramBuilder::from_samples(const std::string& label,
                                                    const std::vector<double>& samples,
                                                    TimestampMs now) {
  ChannelSpectrogram ch;
  ch.label = label;

  const size_t window_samples = seconds_to_samples(opt_.window_sec, fs_hz_);
  const size_t n = std::min(window_samples, samples.size());
  const auto plan = plan_stft(window_samples, n, opt_);
  if (!plan) return ch;

  const std::vector<double> x(samples.end() - static_cast<std::ptrdiff_t>(n), samples.end());

  StftOptions so;
  so.nperseg = plan->nperseg;
  so.hop = plan->hop;
  so.nfft = plan->nfft;
  so.detrend_global = true;
  so.detrend_mean = false;
  so.max_freq_hz = opt_.max_freq_hz;

  const StftResult r = stft_spectrogram_psd(x, fs_hz_, so);
  ++stft_invocations_;

  ch.source = SpectrogramSource::Stft;
  ch.freqs_hz = r.freqs_hz;
  ch.n_freq = r.n_freq;
  ch.n_frames = r.n_frames;
  ch.db.resize(r.psd.size());
  for (size_t i = 0; i < r.psd.size(); ++i) ch.db[i] = to_db(r.psd[i], opt_.db_floor_power);

  // Frame centers relative to the newest sample, which arrived at `now`.
  const double duration_sec = static_cast<double>(n) / fs_hz_;
  ch.times_ms.resize(r.n_frames);
  for (size_t f = 0; f < r.n_frames; ++f) {
    const double back_sec = duration_sec - r.times_sec[f];
    ch.times_ms[f] = now - static_cast<TimestampMs>(std::llround(back_sec * 1000.0));
  }
  return ch;
}

SpectrogramImage SpectrogramBuilder::build(const std::vector<SpectrogramInput>& inputs, TimestampMs now) {
  SpectrogramImage image;
  const TimestampMs window_ms = sec_to_ms(opt_.window_sec);

  bool any_stft = false;
  bool any_cached = false;
  for (const auto& in : inputs) {
    std::vector<SpectrogramSlice> slices;
    for (const auto& s : in.cached_slices) {
      if (s.t >= now - window_ms && s.t <= now) slices.push_back(s);
    }

    ChannelSpectrogram ch;
    if (slices.size() >= std::max<size_t>(1, opt_.min_cached_slices)) {
      ch = from_slices(in.label, slices);
    }
    if (ch.empty()) {
      ch = from_samples(in.label, in.samples, now);
    }

    if (ch.source == SpectrogramSource::Stft) any_stft = true;
    if (ch.source == SpectrogramSource::CachedSlices) any_cached = true;
    image.channels.push_back(std::move(ch));
  }

  if (any_stft) {
    image.source = SpectrogramSource::Stft;
  } else if (any_cached) {
    image.source = SpectrogramSource::CachedSlices;
  }

  image.domain = compute_color_domain(image.channels, opt_);
  rasterize_spectrogram(&image, opt_);
  return image;
}

} // namespace biostream
