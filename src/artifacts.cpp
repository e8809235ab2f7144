#include "biostream/artifacts.hpp"

#include "biostream/periodogram.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace biostream {

size_t ArtifactReport::count_flagged() const {
  size_t n = 0;
  for (const auto& w : windows) {
    if (w.any()) ++n;
  }
  return n;
}

static size_t window_to_samples(double sec, double fs_hz) {
  const long long n = std::llround(sec * fs_hz);
  return static_cast<size_t>(std::max(1LL, n));
}

double line_noise_ratio(const std::vector<double>& x,
                        double fs_hz,
                        double line_hz,
                        double band_hz,
                        double max_hz) {
  if (x.size() < 8) return 0.0;
  const Periodogram p = compute_raw_periodogram(x, fs_hz);

  const double half_band = std::max(0.1, band_hz / 2.0);
  double total = 0.0;
  double line = 0.0;
  for (size_t i = 0; i < p.freqs_hz.size(); ++i) {
    const double f = p.freqs_hz[i];
    if (f < 0.5) continue;
    if (max_hz > 0.0 && f > max_hz) continue;
    const double power = p.psd[i];
    if (!std::isfinite(power)) continue;
    total += power;
    if (std::fabs(f - line_hz) <= half_band) line += power;
  }
  if (!(total > 0.0)) return 0.0;
  return line / total;
}

ArtifactReport detect_artifacts(const std::vector<double>& trace,
                                double fs_hz,
                                const ArtifactOptions& opt) {
  if (!(fs_hz > 0.0)) throw std::runtime_error("detect_artifacts: fs_hz must be > 0");

  ArtifactReport report;
  const size_t win = window_to_samples(opt.window_sec, fs_hz);
  const size_t step = window_to_samples(opt.step_sec, fs_hz);
  if (trace.size() < win) return report;

  for (size_t start = 0; start + win <= trace.size(); start += step) {
    const auto first = trace.begin() + static_cast<std::ptrdiff_t>(start);
    const auto last = first + static_cast<std::ptrdiff_t>(win);
    const auto mm = std::minmax_element(first, last);

    ArtifactWindow w;
    w.start_sample = start;
    w.end_sample = start + win;
    w.amplitude_range = *mm.second - *mm.first;
    if (!std::isfinite(w.amplitude_range)) w.amplitude_range = 0.0;

    const std::vector<double> segment(first, last);
    w.line_noise_ratio = line_noise_ratio(segment, fs_hz, opt.line_noise_hz,
                                          opt.line_noise_band_hz, opt.line_noise_max_hz);

    w.amplitude_artifact = opt.amplitude_range_threshold > 0.0 &&
                           w.amplitude_range > opt.amplitude_range_threshold;
    w.line_noise_artifact = opt.line_noise_ratio_threshold > 0.0 &&
                            w.line_noise_ratio > opt.line_noise_ratio_threshold;
    report.windows.push_back(w);
  }

  if (!report.windows.empty()) report.latest = report.windows.back();
  return report;
}

} // namespace biostream
