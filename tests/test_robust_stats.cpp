#include "biostream/robust_stats.hpp"

#include "test_support.hpp"
#include <cmath>
#include <iostream>
#include <vector>

static bool approx(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

int main() {
  using namespace biostream;

  // Even count => average the middle two.
  {
    std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
    const double med = median_inplace(&v);
    assert(approx(med, 2.5));
  }

  {
    const std::vector<double> v = {3.0, 1.0, 2.0};
    assert(approx(median(v), 2.0));
    assert(v[0] == 3.0);  // input untouched
  }

  // Outlier should not move the median much; MAD stays small.
  {
    const std::vector<double> v = {1.0, 2.0, 3.0, 4.0, 100.0};
    const double med = median(v);
    assert(approx(med, 3.0));
    // abs deviations: {2,1,0,1,97} => MAD=1
    assert(approx(median_absolute_deviation(v, med), 1.0));
  }

  // Quantiles (linearly interpolated empirical quantile with q*(n-1))
  {
    std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
    assert(approx(quantile_inplace(&v, 0.0), 1.0));
  }
  {
    std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
    assert(approx(quantile_inplace(&v, 1.0), 4.0));
  }
  {
    // q=0.25 => idx=0.75 => 1 + 0.75*(2-1)=1.75
    std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
    assert(approx(quantile_inplace(&v, 0.25), 1.75));
  }
  {
    // q is clamped to [0,1]
    std::vector<double> v = {4.0, 1.0, 3.0, 2.0};
    assert(approx(quantile_inplace(&v, -1.0), 1.0));
  }
  {
    std::vector<double> v = {4.0, 1.0, 3.0, 2.0};
    assert(approx(quantile_inplace(&v, 2.0), 4.0));
  }

  // p95 - p05 over 0..100 => 95 - 5
  {
    std::vector<double> v;
    for (int i = 0; i <= 100; ++i) v.push_back(static_cast<double>(i));
    assert(approx(quantile_spread(v, 0.05, 0.95), 90.0));
    assert(approx(mean(v), 50.0));
  }

  // Constant data => MAD == 0.
  {
    const std::vector<double> v = {1.0, 1.0, 1.0};
    assert(approx(median_absolute_deviation(v, median(v)), 0.0));
    assert(approx(quantile_spread(v, 0.05, 0.95), 0.0));
  }

  {
    const std::vector<double> empty;
    assert(median(empty) == 0.0);
    assert(mean(empty) == 0.0);
  }

  std::cout << "test_robust_stats OK\n";
  return 0;
}
