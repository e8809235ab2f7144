#include "biostream/periodogram_averager.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace biostream {

static bool same_axis(const Periodogram& a, const Periodogram& b) {
  if (a.freqs_hz.size() != b.freqs_hz.size()) return false;
  for (size_t i = 0; i < a.freqs_hz.size(); ++i) {
    if (std::fabs(a.freqs_hz[i] - b.freqs_hz[i]) > 1e-9) return false;
  }
  return true;
}

Periodogram average_periodograms(const std::vector<Periodogram>& items) {
  if (items.empty()) throw std::runtime_error("average_periodograms: no periodograms");

  const Periodogram& first = items.front();
  Periodogram out;
  out.freqs_hz = first.freqs_hz;
  out.psd.assign(first.psd.size(), 0.0);

  for (const auto& p : items) {
    if (!same_axis(first, p) || p.psd.size() != first.psd.size()) {
      throw std::runtime_error("average_periodograms: frequency axes differ");
    }
    for (size_t i = 0; i < p.psd.size(); ++i) out.psd[i] += p.psd[i];
  }

  const double inv = 1.0 / static_cast<double>(items.size());
  for (double& v : out.psd) v *= inv;
  return out;
}

PeriodogramAverager::PeriodogramAverager(size_t max_count) : max_count_(max_count) {
  if (max_count_ == 0) throw std::runtime_error("PeriodogramAverager: max_count must be > 0");
}

void PeriodogramAverager::push(Periodogram p) {
  if (p.psd.size() != p.freqs_hz.size()) {
    throw std::runtime_error("PeriodogramAverager::push: psd/frequency size mismatch");
  }
  if (!items_.empty() && !same_axis(items_.front(), p)) {
    throw std::runtime_error("PeriodogramAverager::push: frequency axis differs from buffered periodograms");
  }
  items_.push_back(std::move(p));
  while (items_.size() > max_count_) items_.pop_front();
}

std::optional<Periodogram> PeriodogramAverager::average() const {
  if (items_.empty()) return std::nullopt;
  return average_periodograms(std::vector<Periodogram>(items_.begin(), items_.end()));
}

} // namespace biostream
