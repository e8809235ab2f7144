#include "biostream/periodogram.hpp"

#include "biostream/biquad.hpp"
#include "biostream/fft.hpp"

#include <cmath>
#include <stdexcept>

namespace biostream {

static Periodogram periodogram_impl(std::vector<double> x,
                                    double fs_hz,
                                    const SpectralOptions* notch) {
  if (x.empty()) throw std::runtime_error("compute_periodogram: empty input");
  if (!(fs_hz > 0.0)) throw std::runtime_error("compute_periodogram: fs_hz must be > 0");

  const size_t n = x.size();

  double mean = 0.0;
  for (double v : x) mean += v;
  mean /= static_cast<double>(n);
  for (double& v : x) v -= mean;

  if (notch && notch->notch_enabled) {
    BiquadChain chain({design_notch(fs_hz, notch->notch_hz, notch->notch_q)});
    chain.process_inplace(&x);
  }

  const std::vector<double> w = hann_window(n);
  double wss = 0.0;
  for (size_t i = 0; i < n; ++i) {
    x[i] *= w[i];
    wss += w[i] * w[i];
  }
  // n == 1 gives a unit window; n == 2 would give an all-zero Hann window.
  if (!(wss > 0.0)) wss = 1.0;

  const size_t nfft = next_power_of_two(n);

  Periodogram out;
  one_sided_psd(x, nfft, fs_hz, wss, &out.psd);
  out.freqs_hz.resize(out.psd.size());
  for (size_t k = 0; k < out.psd.size(); ++k) {
    out.freqs_hz[k] = bin_frequency(k, nfft, fs_hz);
  }
  return out;
}

Periodogram compute_periodogram(const std::vector<double>& x,
                                double fs_hz,
                                const SpectralOptions& opt) {
  return periodogram_impl(x, fs_hz, &opt);
}

Periodogram compute_raw_periodogram(const std::vector<double>& x, double fs_hz) {
  return periodogram_impl(x, fs_hz, nullptr);
}

Periodogram restrict_to_max_freq(const Periodogram& p, double max_hz) {
  Periodogram out;
  for (size_t i = 0; i < p.freqs_hz.size() && i < p.psd.size(); ++i) {
    if (p.freqs_hz[i] > max_hz) break;
    out.freqs_hz.push_back(p.freqs_hz[i]);
    out.psd.push_back(p.psd[i]);
  }
  return out;
}

double bin_width(const Periodogram& p) {
  if (p.freqs_hz.size() < 2) return 1.0;
  return std::fabs(p.freqs_hz[1] - p.freqs_hz[0]);
}

double integrate_band(const Periodogram& p, double f_lo, double f_hi) {
  const double df = bin_width(p);
  double acc = 0.0;
  for (size_t i = 0; i < p.freqs_hz.size() && i < p.psd.size(); ++i) {
    const double f = p.freqs_hz[i];
    if (f < f_lo || f > f_hi) continue;
    acc += p.psd[i] * df;
  }
  return acc;
}

} // namespace biostream
