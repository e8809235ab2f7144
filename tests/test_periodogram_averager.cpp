#include "biostream/periodogram_averager.hpp"

#include "test_support.hpp"

#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace biostream;

static Periodogram make(const std::vector<double>& psd, double df = 1.0) {
  Periodogram p;
  for (size_t i = 0; i < psd.size(); ++i) p.freqs_hz.push_back(static_cast<double>(i) * df);
  p.psd = psd;
  return p;
}

static bool throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

int main() {
  {
    const Periodogram avg = average_periodograms({make({1, 2, 3}), make({3, 4, 5})});
    assert((avg.psd == std::vector<double>{2, 3, 4}));
    assert((avg.freqs_hz == std::vector<double>{0, 1, 2}));
  }

  assert(throws([] { (void)average_periodograms({}); }));
  assert(throws([] { (void)average_periodograms({make({1, 2, 3}), make({1, 2, 3}, 0.5)}); }));
  assert(throws([] { (void)average_periodograms({make({1, 2, 3}), make({1, 2})}); }));

  {
    PeriodogramAverager avg(2);
    assert(!avg.average());

    avg.push(make({1, 2, 3}));
    assert((avg.average()->psd == std::vector<double>{1, 2, 3}));

    avg.push(make({3, 4, 5}));
    avg.push(make({5, 6, 7}));
    assert(avg.count() == 2);
    assert((avg.average()->psd == std::vector<double>{4, 5, 6}));

    assert(throws([&] { avg.push(make({1, 2, 3, 4})); }));
    assert(avg.count() == 2);

    avg.clear();
    assert(!avg.average());
  }

  assert(throws([] { PeriodogramAverager bad(0); }));

  std::cout << "test_periodogram_averager OK\n";
  return 0;
}
