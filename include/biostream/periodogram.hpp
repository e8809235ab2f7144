#pragma once

#include "biostream/types.hpp"

#include <cstddef>
#include <vector>

namespace biostream {

struct SpectralOptions {
  // Number of most recent samples per estimate.
  size_t fft_window{1024};

  // Optional second-order IIR notch (one causal pass, zero initial state).
  bool notch_enabled{true};
  double notch_hz{60.0};
  double notch_q{30.0};
};

// Single-window periodogram of x (uses all of x):
// mean removal, optional notch, Hann window, FFT zero padded to the next
// power of two, one-sided PSD scaled by 1/(fs * sum(w^2)).
//
// Throws std::runtime_error on empty input or fs_hz <= 0.
Periodogram compute_periodogram(const std::vector<double>& x,
                                double fs_hz,
                                const SpectralOptions& opt);

// Same as compute_periodogram() without the notch stage.
Periodogram compute_raw_periodogram(const std::vector<double>& x, double fs_hz);

// Keep only bins with frequency <= max_hz.
Periodogram restrict_to_max_freq(const Periodogram& p, double max_hz);

// Sum of psd * bin_width over bins with f in [f_lo, f_hi].
double integrate_band(const Periodogram& p, double f_lo, double f_hi);

// Spacing of the frequency axis (first gap), 1.0 when undefined.
double bin_width(const Periodogram& p);

} // namespace biostream
