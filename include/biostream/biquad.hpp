#pragma once

#include <cstddef>
#include <vector>

namespace biostream {

// Normalized biquad coefficients for Direct Form II Transposed:
//
//   y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
//
// with a0 assumed to be 1.0 (i.e., b* and a* already divided by a0).
struct BiquadCoeffs {
  double b0{1.0};
  double b1{0.0};
  double b2{0.0};
  double a1{0.0};
  double a2{0.0};
};

// Butterworth quality factor (1/sqrt(2)).
constexpr double kButterworthQ = 0.70710678118654752440;

class Biquad {
public:
  Biquad() = default;
  explicit Biquad(const BiquadCoeffs& c);

  void set_coeffs(const BiquadCoeffs& c);
  const BiquadCoeffs& coeffs() const { return c_; }

  void reset();

  // Process one sample.
  double process(double x);

private:
  BiquadCoeffs c_{};
  double z1_{0.0};
  double z2_{0.0};
};

// A small cascade of biquad filters.
class BiquadChain {
public:
  BiquadChain() = default;
  explicit BiquadChain(const std::vector<BiquadCoeffs>& stages);

  void add_stage(const BiquadCoeffs& c);
  void reset();

  size_t n_stages() const { return stages_.size(); }
  bool empty() const { return stages_.empty(); }

  double process(double x);
  void process_inplace(std::vector<double>* x);

  // Resets the state, then filters a copy of x in one causal pass.
  std::vector<double> filter(const std::vector<double>& x);

private:
  std::vector<Biquad> stages_;
};

// Design helpers (RBJ-style biquad cookbook forms).
BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q);
BiquadCoeffs design_highpass(double fs_hz, double f0_hz, double Q);
BiquadCoeffs design_notch(double fs_hz, double f0_hz, double Q);

// Fourth-order low-pass: two identical Butterworth-Q low-pass sections.
BiquadChain make_lowpass4(double fs_hz, double cutoff_hz);

// Band-pass: Butterworth-Q high-pass at low_hz followed by a low-pass at high_hz.
BiquadChain make_bandpass(double fs_hz, double low_hz, double high_hz);

} // namespace biostream
