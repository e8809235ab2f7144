#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace biostream {

// Small robust statistics helpers used across the project.
//
// - median_inplace(): O(n) average time via nth_element (modifies the input vector)
// - quantile_inplace(): O(n) average time via nth_element (modifies the input vector)
// - median_absolute_deviation(): unscaled MAD around a given median

inline double median_inplace(std::vector<double>* v) {
  if (!v || v->empty()) return 0.0;
  const size_t n = v->size();
  const size_t mid = n / 2;
  std::nth_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(mid), v->end());
  double med = (*v)[mid];
  if (n % 2 == 0) {
    // Need the lower middle as well.
    auto max_it = std::max_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(mid));
    med = 0.5 * (med + *max_it);
  }
  return med;
}

inline double median(const std::vector<double>& values) {
  std::vector<double> tmp = values;
  return median_inplace(&tmp);
}

// Linearly-interpolated empirical quantile.
//
// - q is clamped to [0,1].
// - q=0 returns min, q=1 returns max.
// - For 0<q<1, uses linear interpolation between the two nearest order statistics
//   at index q*(n-1).
inline double quantile_inplace(std::vector<double>* v, double q) {
  if (!v || v->empty()) return 0.0;

  if (!std::isfinite(q)) q = 0.5;
  if (q < 0.0) q = 0.0;
  if (q > 1.0) q = 1.0;

  const size_t n = v->size();
  if (n == 1) return (*v)[0];

  const double idx = q * static_cast<double>(n - 1);
  const size_t lo = static_cast<size_t>(std::floor(idx));
  const size_t hi = static_cast<size_t>(std::ceil(idx));

  std::nth_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(lo), v->end());
  const double a = (*v)[lo];
  if (hi == lo) return a;

  std::nth_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(hi), v->end());
  const double b = (*v)[hi];

  const double t = idx - static_cast<double>(lo);
  return a + (b - a) * t;
}

inline double quantile(const std::vector<double>& values, double q) {
  std::vector<double> tmp = values;
  return quantile_inplace(&tmp, q);
}

// Median of |x - med|. No Gaussian consistency factor is applied.
inline double median_absolute_deviation(const std::vector<double>& values, double med) {
  if (values.empty()) return 0.0;
  std::vector<double> absdev;
  absdev.reserve(values.size());
  for (double x : values) absdev.push_back(std::fabs(x - med));
  return median_inplace(&absdev);
}

// Spread between two quantiles, e.g. p95 - p05.
inline double quantile_spread(const std::vector<double>& values, double q_lo, double q_hi) {
  if (values.empty()) return 0.0;
  std::vector<double> tmp = values;
  const double lo = quantile_inplace(&tmp, q_lo);
  const double hi = quantile_inplace(&tmp, q_hi);
  return hi - lo;
}

inline double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  double sum = 0.0;
  for (double x : values) sum += x;
  return sum / static_cast<double>(values.size());
}

} // namespace biostream
