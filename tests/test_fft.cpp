#include "biostream/fft.hpp"

#include "test_support.hpp"

#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>
#include <vector>

using biostream_test::approx;

int main() {
  using namespace biostream;

  // FFT of impulse should be all ones
  {
    std::vector<std::complex<double>> a(4);
    a[0] = {1.0, 0.0};

    fft_inplace(a, false);
    for (auto& x : a) {
      TEST_CHECK(approx(x.real(), 1.0, 1e-9));
      TEST_CHECK(approx(x.imag(), 0.0, 1e-9));
    }

    fft_inplace(a, true);
    TEST_CHECK(approx(a[0].real(), 1.0, 1e-9));
    TEST_CHECK(approx(a[1].real(), 0.0, 1e-9));
  }

  {
    TEST_CHECK(is_power_of_two(1));
    TEST_CHECK(is_power_of_two(1024));
    TEST_CHECK(!is_power_of_two(0));
    TEST_CHECK(!is_power_of_two(1000));
    TEST_CHECK(next_power_of_two(1000) == 1024);
    TEST_CHECK(next_power_of_two(1024) == 1024);

    bool threw = false;
    try {
      (void)next_power_of_two(0);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    TEST_CHECK(threw);
  }

  // Hann window: zero endpoints, unit peak in the middle (odd length).
  {
    const auto w = hann_window(9);
    TEST_CHECK(w.size() == 9);
    TEST_CHECK(approx(w.front(), 0.0, 1e-12));
    TEST_CHECK(approx(w.back(), 0.0, 1e-12));
    TEST_CHECK(approx(w[4], 1.0, 1e-12));
    TEST_CHECK(hann_window(1).size() == 1 && hann_window(1)[0] == 1.0);
  }

  // Rectangular window: integrated one-sided PSD equals mean square.
  {
    const double fs = 256.0;
    const size_t n = 256;
    const double amp = 3.0;
    std::vector<double> x(n);
    for (size_t i = 0; i < n; ++i) {
      x[i] = amp * std::sin(2.0 * 3.14159265358979323846 * 16.0 * static_cast<double>(i) / fs);
    }

    std::vector<double> psd;
    one_sided_psd(x, n, fs, static_cast<double>(n), &psd);
    TEST_CHECK(psd.size() == n / 2 + 1);

    size_t kmax = 0;
    double total = 0.0;
    for (size_t k = 0; k < psd.size(); ++k) {
      total += psd[k] * (fs / static_cast<double>(n));
      if (psd[k] > psd[kmax]) kmax = k;
    }
    TEST_CHECK(kmax == 16);
    TEST_CHECK(approx(bin_frequency(kmax, n, fs), 16.0, 1e-12));
    TEST_CHECK(approx(total, amp * amp / 2.0, 1e-9));

    bool threw = false;
    try {
      one_sided_psd(x, 100, fs, 1.0, &psd);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    TEST_CHECK(threw);
  }

  std::cout << "test_fft OK\n";
  return 0;
}
