#include "biostream/sample_buffer.hpp"

#include "test_support.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

int main() {
  using namespace biostream;

  {
    bool threw = false;
    try {
      SampleBuffer b(0);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // Fill below capacity, then wrap.
  {
    SampleBuffer b(5);
    assert(b.empty());
    b.append(std::vector<double>{1, 2, 3});
    assert(b.size() == 3);
    assert((b.snapshot() == std::vector<double>{1, 2, 3}));

    b.append(std::vector<double>{4, 5, 6, 7});
    assert(b.full());
    assert(b.size() == 5);
    assert(b.total_appended() == 7);
    assert((b.snapshot() == std::vector<double>{3, 4, 5, 6, 7}));
    assert((b.tail(2) == std::vector<double>{6, 7}));
    assert(b.tail(100).size() == 5);
  }

  // A packet larger than the capacity keeps only its newest samples.
  {
    SampleBuffer b(4);
    b.append(std::vector<double>{1});
    b.append(std::vector<double>{10, 11, 12, 13, 14, 15});
    assert((b.snapshot() == std::vector<double>{12, 13, 14, 15}));
    b.append(std::vector<double>{16});
    assert((b.snapshot() == std::vector<double>{13, 14, 15, 16}));
    assert(b.total_appended() == 8);
  }

  // Empty packets are no-ops; clear() resets counters.
  {
    SampleBuffer b(3);
    b.append(std::vector<double>{});
    assert(b.total_appended() == 0);
    b.append(std::vector<double>{1, 2});
    b.clear();
    assert(b.empty());
    assert(b.total_appended() == 0);
    assert(b.tail(3).empty());
  }

  // Capacity helpers.
  {
    assert(seconds_to_samples(8.0, 64.0) == 512);
    assert(seconds_to_samples(-1.0, 64.0) == 0);
    assert(seconds_to_samples(1.0, 0.0) == 0);
    assert(required_eeg_capacity(4096, 1024, 0) == 4096);
    assert(required_eeg_capacity(1000, 1024, 0) == 2048);
    assert(required_eeg_capacity(1000, 1024, 5000) == 6024);
    assert(required_ppg_capacity(1024, 0, 512) == 1024);
    assert(required_ppg_capacity(100, 2000, 512) == 2000);
  }

  std::cout << "test_sample_buffer OK\n";
  return 0;
}
