#include "biostream/ppg_vitals.hpp"

#include "biostream/biquad.hpp"
#include "biostream/robust_stats.hpp"
#include "biostream/sample_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace biostream {

const char* vitals_reason_name(VitalsReason r) {
  switch (r) {
    case VitalsReason::Ok: return "OK";
    case VitalsReason::DcZero: return "DC_ZERO";
    case VitalsReason::AcZero: return "AC_ZERO";
    case VitalsReason::PiNan: return "PI_NAN";
    case VitalsReason::PiLow: return "PI_LOW";
    case VitalsReason::NoSignal: return "NO_SIGNAL";
    case VitalsReason::NoData: return "NO_DATA";
  }
  return "UNKNOWN";
}

static std::vector<double> detrend(const std::vector<double>& x) {
  const double m = mean(x);
  std::vector<double> out(x.size());
  for (size_t i = 0; i < x.size(); ++i) out[i] = x[i] - m;
  return out;
}

static std::vector<double> last_n(const std::vector<double>& x, size_t n) {
  n = std::min(n, x.size());
  return std::vector<double>(x.end() - static_cast<std::ptrdiff_t>(n), x.end());
}

static bool long_enough(const std::vector<double>& x, double fs_hz, const PpgVitalsOptions& opt) {
  return static_cast<double>(x.size()) >= fs_hz * opt.min_signal_sec;
}

std::vector<double> pulse_bandpass(const std::vector<double>& x, double fs_hz, const PpgVitalsOptions& opt) {
  if (x.empty()) return {};
  BiquadChain bp = make_bandpass(fs_hz, opt.ac_low_hz, opt.ac_high_hz);
  return bp.filter(detrend(x));
}

PerfusionResult compute_perfusion(const std::vector<double>& window, double fs_hz, const PpgVitalsOptions& opt) {
  PerfusionResult r;
  if (window.empty()) return r;
  if (!std::all_of(window.begin(), window.end(), [](double v) { return std::isfinite(v); })) {
    r.dc_mean = std::numeric_limits<double>::quiet_NaN();
    r.ac_amplitude = std::numeric_limits<double>::quiet_NaN();
    return r;
  }

  BiquadChain lp = make_lowpass4(fs_hz, opt.dc_lowpass_hz);
  r.dc_mean = std::fabs(mean(lp.filter(window)));
  r.ac_amplitude = quantile_spread(pulse_bandpass(window, fs_hz, opt), 0.05, 0.95) / 2.0;
  return r;
}

double spo2_from_ratio(double ratio, const PpgVitalsOptions& opt) {
  double v = 0.0;
  if (opt.spo2_model == Spo2Model::Quadratic) {
    v = -45.060 * ratio * ratio + 30.354 * ratio + 94.845;
  } else {
    v = opt.spo2_intercept - opt.spo2_slope * ratio;
  }
  if (!std::isfinite(v)) v = opt.spo2_min;
  return std::max(opt.spo2_min, std::min(opt.spo2_max, v));
}

static const PpgChannelView* find_channel(const std::vector<PpgChannelView>& channels, int id) {
  for (const auto& c : channels) {
    if (c.channel_id == id) return &c;
  }
  return nullptr;
}

std::optional<Spo2Result> estimate_spo2(const std::vector<PpgChannelView>& channels,
                                        double fs_hz,
                                        const PpgVitalsOptions& opt) {
  const size_t win = std::max<size_t>(1, seconds_to_samples(opt.window_sec, fs_hz));
  const PpgChannelView* ir = find_channel(channels, opt.mapping.ir_channel);
  const PpgChannelView* red = find_channel(channels, opt.mapping.red_channel);
  if (!ir || !red) return std::nullopt;
  if (ir->samples.size() < win || red->samples.size() < win) return std::nullopt;

  Spo2Result r;
  r.ir_label = ir->label;
  r.red_label = red->label;

  const PerfusionResult p_ir = compute_perfusion(last_n(ir->samples, win), fs_hz, opt);
  const PerfusionResult p_red = compute_perfusion(last_n(red->samples, win), fs_hz, opt);

  if (p_ir.dc_mean <= 0.0 || p_red.dc_mean <= 0.0) {
    r.reason = VitalsReason::DcZero;
    return r;
  }

  const double pi_ir = p_ir.ac_amplitude / p_ir.dc_mean;
  const double pi_red = p_red.ac_amplitude / p_red.dc_mean;

  if (p_ir.ac_amplitude <= 0.0 || p_red.ac_amplitude <= 0.0) {
    r.reason = VitalsReason::AcZero;
    if (std::isfinite(pi_ir)) r.perfusion_index_ir = pi_ir;
    if (std::isfinite(pi_red)) r.perfusion_index_red = pi_red;
    return r;
  }

  if (!std::isfinite(pi_ir) || !std::isfinite(pi_red)) {
    r.reason = VitalsReason::PiNan;
    return r;
  }

  r.perfusion_index_ir = pi_ir;
  r.perfusion_index_red = pi_red;
  const double ratio = pi_red / pi_ir;
  r.ratio = ratio;

  if (pi_ir <= opt.min_perfusion_index || pi_red <= opt.min_perfusion_index) {
    r.reason = VitalsReason::PiLow;
    return r;
  }

  r.ok = true;
  r.reason = VitalsReason::Ok;
  r.spo2 = spo2_from_ratio(ratio, opt);
  return r;
}

std::vector<size_t> find_pulse_peaks(const std::vector<double>& x, double fs_hz, const PpgVitalsOptions& opt) {
  std::vector<size_t> peaks;
  if (x.size() < 3) return peaks;

  const double med = median(x);
  double mad = median_absolute_deviation(x, med);
  if (!(mad > 0.0)) mad = 1e-6;
  const double threshold = med + mad * opt.peak_mad_gain;

  const long long spacing_ll = std::llround(fs_hz * opt.min_peak_spacing_sec);
  const size_t min_spacing = static_cast<size_t>(std::max(1LL, spacing_ll));

  bool have_last = false;
  size_t last_peak = 0;
  for (size_t i = 1; i + 1 < x.size(); ++i) {
    const double v = x[i];
    if (v < threshold) continue;
    if (!(v > x[i - 1] && v > x[i + 1])) continue;

    if (!have_last || i - last_peak >= min_spacing) {
      peaks.push_back(i);
      last_peak = i;
      have_last = true;
    } else if (!peaks.empty() && v > x[peaks.back()]) {
      peaks.back() = i;
      last_peak = i;
    }
  }
  return peaks;
}

std::optional<int> compute_heart_rate_bpm(const std::vector<double>& window,
                                          double fs_hz,
                                          const PpgVitalsOptions& opt) {
  if (window.empty() || !long_enough(window, fs_hz, opt)) return std::nullopt;

  const std::vector<size_t> peaks = find_pulse_peaks(pulse_bandpass(window, fs_hz, opt), fs_hz, opt);
  if (peaks.size() < 2) return std::nullopt;

  std::vector<double> intervals;
  intervals.reserve(peaks.size() - 1);
  for (size_t i = 1; i < peaks.size(); ++i) {
    intervals.push_back(static_cast<double>(peaks[i] - peaks[i - 1]));
  }
  const double med = median(intervals);
  if (!(med > 0.0)) return std::nullopt;

  const long long bpm = std::llround(60.0 * fs_hz / med);
  if (bpm < opt.min_bpm || bpm > opt.max_bpm) return std::nullopt;
  return static_cast<int>(bpm);
}

std::optional<double> pulse_quality(const std::vector<double>& samples,
                                    double fs_hz,
                                    const PpgVitalsOptions& opt) {
  if (samples.empty() || !long_enough(samples, fs_hz, opt)) return std::nullopt;
  const size_t win = std::min(samples.size(), seconds_to_samples(opt.window_sec, fs_hz));
  if (win == 0) return std::nullopt;

  const std::vector<double> filtered = pulse_bandpass(last_n(samples, win), fs_hz, opt);
  const double q = quantile_spread(filtered, 0.05, 0.95);
  if (!std::isfinite(q) || !(q > 0.0)) return std::nullopt;
  return q;
}

PulseResolution resolve_pulse_selection(const std::vector<PpgChannelView>& channels,
                                        double fs_hz,
                                        const PulseSelection& prev,
                                        TimestampMs now,
                                        const PpgVitalsOptions& opt) {
  PulseResolution res;
  res.next = prev;
  if (channels.empty()) return res;

  std::optional<size_t> best;
  double best_q = -std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < channels.size(); ++i) {
    const auto q = pulse_quality(channels[i].samples, fs_hz, opt);
    if (q && *q > best_q) {
      best = i;
      best_q = *q;
    }
  }
  if (!best) return res;

  const PpgChannelView& cand = channels[*best];

  std::optional<size_t> prev_idx;
  if (prev.valid()) {
    for (size_t i = 0; i < channels.size(); ++i) {
      if (channels[i].channel_id == prev.channel_id && !channels[i].samples.empty()) {
        prev_idx = i;
        break;
      }
    }
  }

  if (!prev_idx) {
    res.selected = best;
    res.quality = best_q;
    res.next = PulseSelection{cand.channel_id, cand.label, best_q, now};
    return res;
  }

  if (cand.channel_id == prev.channel_id) {
    res.selected = prev_idx;
    res.quality = best_q;
    res.next = prev;
    if (!channels[*prev_idx].label.empty()) res.next.label = channels[*prev_idx].label;
    res.next.quality = best_q;
    return res;
  }

  if (now - prev.selected_at < opt.pulse_debounce_ms) {
    res.selected = prev_idx;
    res.quality = prev.quality;
    return res;
  }

  res.selected = best;
  res.quality = best_q;
  res.next = PulseSelection{cand.channel_id, cand.label, best_q, now};
  return res;
}

std::vector<PpgChannelView> filter_enabled_channels(const std::vector<PpgChannelView>& channels,
                                                    const PpgVitalsOptions& opt) {
  if (opt.enabled_labels.empty()) return channels;
  const std::set<std::string> enabled(opt.enabled_labels.begin(), opt.enabled_labels.end());

  std::vector<PpgChannelView> out;
  for (const auto& c : channels) {
    const bool keep = enabled.count(c.label) > 0 ||
                      (c.channel_id == opt.mapping.ir_channel && enabled.count("IR") > 0) ||
                      (c.channel_id == opt.mapping.red_channel && enabled.count("RED") > 0) ||
                      (c.channel_id == opt.mapping.ambient_channel && enabled.count("AMBIENT") > 0);
    if (keep) out.push_back(c);
  }
  return out;
}

std::vector<PpgChannelView> exclude_ambient(const std::vector<PpgChannelView>& channels,
                                            const PpgSensorMapping& mapping) {
  std::vector<PpgChannelView> out;
  for (const auto& c : channels) {
    if (c.channel_id != mapping.ambient_channel) out.push_back(c);
  }
  return out;
}

std::vector<double> build_combined_ppg(const std::vector<PpgChannelView>& channels, size_t max_samples) {
  std::vector<const PpgChannelView*> used;
  size_t n = max_samples;
  for (const auto& c : channels) {
    if (c.samples.empty()) continue;
    used.push_back(&c);
    n = std::min(n, c.samples.size());
  }
  if (used.empty() || n == 0) return {};

  std::vector<double> out(n, 0.0);
  for (const PpgChannelView* c : used) {
    const size_t off = c->samples.size() - n;
    for (size_t i = 0; i < n; ++i) out[i] += c->samples[off + i];
  }
  const double inv = 1.0 / static_cast<double>(used.size());
  for (double& v : out) v *= inv;
  return out;
}

std::vector<double> build_cardiogram(const std::vector<double>& window, double fs_hz, const PpgVitalsOptions& opt) {
  std::vector<double> out;
  if (window.empty() || !long_enough(window, fs_hz, opt)) return out;

  const std::vector<double> filtered = pulse_bandpass(window, fs_hz, opt);
  const std::vector<size_t> peaks = find_pulse_peaks(filtered, fs_hz, opt);
  if (peaks.size() < 2) return out;

  const size_t keep = std::max<size_t>(1, opt.cardiogram_segments);
  const size_t first = (peaks.size() > keep) ? peaks.size() - keep : 1;
  for (size_t i = first; i < peaks.size(); ++i) {
    const size_t a = peaks[i - 1];
    const size_t b = peaks[i];
    if (b > a) {
      out.insert(out.end(), filtered.begin() + static_cast<std::ptrdiff_t>(a),
                 filtered.begin() + static_cast<std::ptrdiff_t>(b));
    }
  }
  return out;
}

PpgVitalsEstimator::PpgVitalsEstimator(double fs_hz, PpgVitalsOptions opt)
    : fs_hz_(fs_hz), opt_(std::move(opt)) {
  if (!(fs_hz_ > 0.0)) throw std::runtime_error("PpgVitalsEstimator: fs_hz must be > 0");
  if (!(opt_.window_sec > 0.0)) throw std::runtime_error("PpgVitalsEstimator: window_sec must be > 0");
  // Validate the filter designs once up front.
  (void)make_lowpass4(fs_hz_, opt_.dc_lowpass_hz);
  (void)make_bandpass(fs_hz_, opt_.ac_low_hz, opt_.ac_high_hz);
}

HeartVitals PpgVitalsEstimator::compute(const std::vector<PpgChannelView>& channels_in,
                                        PpgVitalsState* state,
                                        TimestampMs now) const {
  if (!state) throw std::runtime_error("PpgVitalsEstimator::compute: state is null");

  std::vector<PpgChannelView> channels;
  for (const auto& c : channels_in) {
    if (c.channel_id < 0 || c.channel_id > 2 || c.samples.empty()) continue;
    channels.push_back(c);
  }

  const std::vector<PpgChannelView> enabled = filter_enabled_channels(channels, opt_);
  const std::vector<PpgChannelView> processing = exclude_ambient(enabled, opt_.mapping);

  const PulseResolution pulse = resolve_pulse_selection(enabled, fs_hz_, state->selection, now, opt_);
  state->selection = pulse.next;

  HeartVitals out;
  out.combined_ppg = build_combined_ppg(processing, opt_.trace_window);

  if (out.combined_ppg.empty() && !pulse.selected) {
    state->reset();
    out.ok = false;
    out.reason = VitalsReason::NoSignal;
    return out;
  }

  const std::vector<double>& pulse_samples =
      pulse.selected ? enabled[*pulse.selected].samples : out.combined_ppg;
  const size_t win = std::min(pulse_samples.size(), seconds_to_samples(opt_.window_sec, fs_hz_));
  const std::vector<double> hr_window = last_n(pulse_samples, win);

  out.heart_rate_bpm = compute_heart_rate_bpm(hr_window, fs_hz_, opt_);
  out.cardiogram = build_cardiogram(hr_window, fs_hz_, opt_);

  if (pulse.selected) {
    const PpgChannelView& sel = enabled[*pulse.selected];
    out.pulse_channel_id = sel.channel_id;
    out.pulse_channel_label = sel.label;
    out.pulse_quality = pulse.quality;
  }

  if (const PpgChannelView* ir = find_channel(processing, opt_.mapping.ir_channel)) out.ir_label = ir->label;
  if (const PpgChannelView* red = find_channel(processing, opt_.mapping.red_channel)) out.red_label = red->label;

  const std::optional<Spo2Result> spo2 = estimate_spo2(processing, fs_hz_, opt_);
  if (spo2) {
    out.ok = spo2->ok;
    out.reason = spo2->reason;
    out.ratio = spo2->ratio;
    out.perfusion_index_ir = spo2->perfusion_index_ir;
    out.perfusion_index_red = spo2->perfusion_index_red;
  } else {
    out.ok = false;
    out.reason = VitalsReason::NoData;
  }

  state->spo2_ema.set_alpha(opt_.spo2_ema_alpha);
  if (spo2 && spo2->ok && spo2->spo2) {
    state->spo2_ema.update(*spo2->spo2);
  }
  out.spo2 = state->spo2_ema.value();
  return out;
}

} // namespace biostream
