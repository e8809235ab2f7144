#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace biostream {

// Returns true if n is a power of two (and n > 0).
bool is_power_of_two(size_t n);

// Returns the smallest power of two >= n (n must be > 0).
size_t next_power_of_two(size_t n);

// In-place radix-2 FFT.
// - a.size() must be a power of two.
// - if inverse=true, computes inverse FFT (and divides by N).
void fft_inplace(std::vector<std::complex<double>>& a, bool inverse);

// Symmetric Hann window: w[n] = 0.5 * (1 - cos(2*pi*n/(n-1))).
// A length-1 window is {1.0}.
std::vector<double> hann_window(size_t n);

// One-sided PSD of an already windowed frame.
//
// The frame is zero padded to nfft (a power of two >= frame.size()) and
// scaled by 1/(fs * window_energy), where window_energy = sum(w^2) of the
// window applied to the frame. Bins other than DC and Nyquist are doubled.
// Writes nfft/2 + 1 values into *out.
void one_sided_psd(const std::vector<double>& frame,
                   size_t nfft,
                   double fs_hz,
                   double window_energy,
                   std::vector<double>* out);

// Frequency of bin k for an nfft-point transform.
inline double bin_frequency(size_t k, size_t nfft, double fs_hz) {
  return static_cast<double>(k) * fs_hz / static_cast<double>(nfft);
}

} // namespace biostream
