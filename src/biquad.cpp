#include "biostream/biquad.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace biostream {

static constexpr double kPi = 3.141592653589793238462643383279502884;

Biquad::Biquad(const BiquadCoeffs& c) {
  set_coeffs(c);
}

void Biquad::set_coeffs(const BiquadCoeffs& c) {
  c_ = c;
  reset();
}

void Biquad::reset() {
  z1_ = 0.0;
  z2_ = 0.0;
}

double Biquad::process(double x) {
  const double y = c_.b0 * x + z1_;
  z1_ = c_.b1 * x - c_.a1 * y + z2_;
  z2_ = c_.b2 * x - c_.a2 * y;
  return y;
}

BiquadChain::BiquadChain(const std::vector<BiquadCoeffs>& stages) {
  for (const auto& c : stages) add_stage(c);
}

void BiquadChain::add_stage(const BiquadCoeffs& c) {
  stages_.emplace_back(c);
}

void BiquadChain::reset() {
  for (auto& s : stages_) s.reset();
}

double BiquadChain::process(double x) {
  double y = x;
  for (auto& s : stages_) {
    y = s.process(y);
  }
  return y;
}

void BiquadChain::process_inplace(std::vector<double>* x) {
  if (!x) return;
  if (stages_.empty()) return;
  for (double& v : *x) {
    v = process(v);
  }
}

std::vector<double> BiquadChain::filter(const std::vector<double>& x) {
  std::vector<double> y = x;
  reset();
  process_inplace(&y);
  return y;
}

static void validate_design_inputs(double fs_hz, double f0_hz, double Q, const char* what) {
  if (!(fs_hz > 0.0)) throw std::runtime_error(std::string(what) + ": fs_hz must be > 0");
  if (!(f0_hz > 0.0)) throw std::runtime_error(std::string(what) + ": f0_hz must be > 0");
  if (!(f0_hz < 0.5 * fs_hz)) {
    throw std::runtime_error(std::string(what) + ": f0_hz must be < fs/2");
  }
  if (!(Q > 0.0)) throw std::runtime_error(std::string(what) + ": Q must be > 0");
}

static BiquadCoeffs normalize(double b0, double b1, double b2, double a0, double a1, double a2) {
  if (a0 == 0.0) throw std::runtime_error("biquad normalize: a0 is zero");
  BiquadCoeffs c;
  c.b0 = b0 / a0;
  c.b1 = b1 / a0;
  c.b2 = b2 / a0;
  c.a1 = a1 / a0;
  c.a2 = a2 / a0;
  return c;
}

BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_lowpass");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double alpha = std::sin(w0) / (2.0 * Q);

  return normalize((1.0 - cosw0) / 2.0, 1.0 - cosw0, (1.0 - cosw0) / 2.0,
                   1.0 + alpha, -2.0 * cosw0, 1.0 - alpha);
}

BiquadCoeffs design_highpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_highpass");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double alpha = std::sin(w0) / (2.0 * Q);

  return normalize((1.0 + cosw0) / 2.0, -(1.0 + cosw0), (1.0 + cosw0) / 2.0,
                   1.0 + alpha, -2.0 * cosw0, 1.0 - alpha);
}

BiquadCoeffs design_notch(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_notch");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double alpha = std::sin(w0) / (2.0 * Q);

  return normalize(1.0, -2.0 * cosw0, 1.0,
                   1.0 + alpha, -2.0 * cosw0, 1.0 - alpha);
}

BiquadChain make_lowpass4(double fs_hz, double cutoff_hz) {
  const BiquadCoeffs c = design_lowpass(fs_hz, cutoff_hz, kButterworthQ);
  return BiquadChain({c, c});
}

BiquadChain make_bandpass(double fs_hz, double low_hz, double high_hz) {
  if (!(low_hz < high_hz)) {
    throw std::runtime_error("make_bandpass: low_hz must be < high_hz");
  }
  return BiquadChain({design_highpass(fs_hz, low_hz, kButterworthQ),
                      design_lowpass(fs_hz, high_hz, kButterworthQ)});
}

} // namespace biostream
