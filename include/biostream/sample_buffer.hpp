#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace biostream {

// Fixed-capacity sliding window of samples for one channel.
//
// append() writes in arrival order; once the buffer is full the oldest samples
// are overwritten. Readers always receive copies (oldest first).
class SampleBuffer {
public:
  explicit SampleBuffer(size_t capacity);

  void append(const double* x, size_t n);
  void append(const std::vector<double>& x) { append(x.data(), x.size()); }

  size_t size() const { return count_; }
  size_t capacity() const { return buf_.size(); }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ == buf_.size(); }

  // Number of samples appended since construction or the last clear().
  // Used to detect "new data since the previous tick".
  uint64_t total_appended() const { return total_; }

  void clear();

  // All retained samples, oldest first.
  std::vector<double> snapshot() const;

  // The most recent min(n, size()) samples, oldest first.
  std::vector<double> tail(size_t n) const;

private:
  std::vector<double> buf_;
  size_t head_{0};   // next write position
  size_t count_{0};
  uint64_t total_{0};
};

// round(sec * fs), 0 for non-positive inputs.
size_t seconds_to_samples(double sec, double fs_hz);

// Minimum EEG buffer capacity that keeps every consumer fed:
// max(trace window, 2 x FFT window, export window + FFT window).
size_t required_eeg_capacity(size_t trace_window, size_t fft_window, size_t export_window);

// Minimum PPG buffer capacity: max(trace window, export window, vitals window).
size_t required_ppg_capacity(size_t trace_window, size_t export_window, size_t vitals_window);

} // namespace biostream
