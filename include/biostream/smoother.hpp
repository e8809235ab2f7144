#pragma once

#include <cmath>
#include <optional>

namespace biostream {

// A tiny exponential moving average (EMA) smoother with a fixed weight.
//
// Semantics:
// - The first finite value initializes the average.
// - Later values update y <- y + alpha * (x - y).
// - Non-finite inputs are ignored and the current value is returned.
// - alpha is clamped to [0,1]; alpha=1 is a pass-through.
class ExponentialSmoother {
public:
  ExponentialSmoother() = default;
  explicit ExponentialSmoother(double alpha) { set_alpha(alpha); }

  void reset() { y_.reset(); }

  void set_alpha(double alpha) {
    if (!std::isfinite(alpha)) alpha = 1.0;
    if (alpha < 0.0) alpha = 0.0;
    if (alpha > 1.0) alpha = 1.0;
    alpha_ = alpha;
  }

  double alpha() const { return alpha_; }
  bool has_value() const { return y_.has_value(); }
  const std::optional<double>& value() const { return y_; }

  std::optional<double> update(double x) {
    if (!std::isfinite(x)) return y_;
    if (!y_) {
      y_ = x;
    } else {
      *y_ += alpha_ * (x - *y_);
    }
    return y_;
  }

private:
  double alpha_{0.2};
  std::optional<double> y_;
};

} // namespace biostream
