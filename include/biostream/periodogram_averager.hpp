#pragma once

#include "biostream/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace biostream {

// Plain per-bin mean of periodograms sharing one frequency axis.
// The axis is taken from the first entry.
//
// Throws std::runtime_error if the list is empty or the axes differ.
Periodogram average_periodograms(const std::vector<Periodogram>& items);

// Keeps the most recent max_count periodograms of one channel.
class PeriodogramAverager {
public:
  explicit PeriodogramAverager(size_t max_count = 4);

  // Throws std::runtime_error if p does not share the axis of the buffered
  // periodograms.
  void push(Periodogram p);

  // Mean of the buffered periodograms; nullopt when nothing has been pushed.
  std::optional<Periodogram> average() const;

  size_t count() const { return items_.size(); }
  size_t max_count() const { return max_count_; }
  void clear() { items_.clear(); }

private:
  size_t max_count_{4};
  std::deque<Periodogram> items_;
};

} // namespace biostream
