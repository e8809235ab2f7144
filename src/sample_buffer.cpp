#include "biostream/sample_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace biostream {

SampleBuffer::SampleBuffer(size_t capacity) : buf_(capacity, 0.0) {
  if (capacity == 0) throw std::runtime_error("SampleBuffer: capacity must be > 0");
}

void SampleBuffer::append(const double* x, size_t n) {
  if (n == 0) return;
  if (!x) throw std::runtime_error("SampleBuffer::append: null data");
  const size_t cap = buf_.size();
  total_ += n;

  // Only the last `cap` samples of a large packet can survive.
  if (n >= cap) {
    std::copy(x + (n - cap), x + n, buf_.begin());
    head_ = 0;
    count_ = cap;
    return;
  }

  for (size_t i = 0; i < n; ++i) {
    buf_[head_] = x[i];
    head_ = (head_ + 1) % cap;
  }
  count_ = std::min(cap, count_ + n);
}

void SampleBuffer::clear() {
  head_ = 0;
  count_ = 0;
  total_ = 0;
}

std::vector<double> SampleBuffer::snapshot() const {
  return tail(count_);
}

std::vector<double> SampleBuffer::tail(size_t n) const {
  n = std::min(n, count_);
  std::vector<double> out(n);
  if (n == 0) return out;
  const size_t cap = buf_.size();
  // head_ is one past the newest sample.
  const size_t start = (head_ + cap - n) % cap;
  for (size_t i = 0; i < n; ++i) {
    out[i] = buf_[(start + i) % cap];
  }
  return out;
}

size_t seconds_to_samples(double sec, double fs_hz) {
  if (!(fs_hz > 0.0)) return 0;
  if (!(sec > 0.0)) return 0;
  return static_cast<size_t>(std::llround(sec * fs_hz));
}

size_t required_eeg_capacity(size_t trace_window, size_t fft_window, size_t export_window) {
  return std::max({trace_window, 2 * fft_window, export_window + fft_window});
}

size_t required_ppg_capacity(size_t trace_window, size_t export_window, size_t vitals_window) {
  return std::max({trace_window, export_window, vitals_window});
}

} // namespace biostream
