#include "biostream/fft.hpp"

#include <cmath>
#include <stdexcept>

namespace biostream {

static constexpr double kPi = 3.141592653589793238462643383279502884;

bool is_power_of_two(size_t n) {
  return n != 0 && (n & (n - 1)) == 0;
}

size_t next_power_of_two(size_t n) {
  if (n == 0) throw std::runtime_error("next_power_of_two: n must be > 0");
  size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

static size_t reverse_bits(size_t x, unsigned bits) {
  size_t y = 0;
  for (unsigned i = 0; i < bits; ++i) {
    y = (y << 1) | (x & 1);
    x >>= 1;
  }
  return y;
}

void fft_inplace(std::vector<std::complex<double>>& a, bool inverse) {
  const size_t n = a.size();
  if (!is_power_of_two(n)) {
    throw std::runtime_error("fft_inplace: size must be a power of two");
  }

  unsigned bits = 0;
  while ((static_cast<size_t>(1) << bits) < n) ++bits;

  for (size_t i = 0; i < n; ++i) {
    const size_t j = reverse_bits(i, bits);
    if (j > i) std::swap(a[i], a[j]);
  }

  for (size_t len = 2; len <= n; len <<= 1) {
    double ang = 2.0 * kPi / static_cast<double>(len);
    if (!inverse) ang = -ang;
    const std::complex<double> wlen(std::cos(ang), std::sin(ang));

    for (size_t i = 0; i < n; i += len) {
      std::complex<double> w(1.0, 0.0);
      for (size_t j = 0; j < len / 2; ++j) {
        const std::complex<double> u = a[i + j];
        const std::complex<double> v = a[i + j + len / 2] * w;
        a[i + j] = u + v;
        a[i + j + len / 2] = u - v;
        w *= wlen;
      }
    }
  }

  if (inverse) {
    for (auto& x : a) x /= static_cast<double>(n);
  }
}

std::vector<double> hann_window(size_t n) {
  std::vector<double> w(n, 1.0);
  if (n <= 1) return w;
  const double denom = static_cast<double>(n - 1);
  for (size_t i = 0; i < n; ++i) {
    w[i] = 0.5 * (1.0 - std::cos(2.0 * kPi * static_cast<double>(i) / denom));
  }
  return w;
}

void one_sided_psd(const std::vector<double>& frame,
                   size_t nfft,
                   double fs_hz,
                   double window_energy,
                   std::vector<double>* out) {
  if (!out) throw std::runtime_error("one_sided_psd: out is null");
  if (frame.empty()) throw std::runtime_error("one_sided_psd: empty frame");
  if (!is_power_of_two(nfft) || nfft < frame.size()) {
    throw std::runtime_error("one_sided_psd: nfft must be a power of two >= frame size");
  }
  if (!(fs_hz > 0.0)) throw std::runtime_error("one_sided_psd: fs_hz must be > 0");
  if (!(window_energy > 0.0)) throw std::runtime_error("one_sided_psd: window energy must be > 0");

  std::vector<std::complex<double>> buf(nfft, std::complex<double>(0.0, 0.0));
  for (size_t i = 0; i < frame.size(); ++i) buf[i] = std::complex<double>(frame[i], 0.0);
  fft_inplace(buf, false);

  const size_t nfreq = nfft / 2 + 1;
  const double scale = 1.0 / (fs_hz * window_energy);
  out->assign(nfreq, 0.0);
  for (size_t k = 0; k < nfreq; ++k) {
    double p = std::norm(buf[k]) * scale;
    // One-sided: double all bins except DC and Nyquist.
    if (k != 0 && k != nfft / 2) p *= 2.0;
    (*out)[k] = p;
  }
}

} // namespace biostream
