#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace biostream {

// Milliseconds on the caller's clock. The core never reads a wall clock
// itself; every timestamp is handed in through ingest()/tick().
using TimestampMs = int64_t;

struct RGB {
  uint8_t r{0}, g{0}, b{0};
};

// One-sided power spectral density estimate of a single window.
//
// Invariants:
// - freqs_hz is strictly increasing and starts at 0 Hz
// - psd.size() == freqs_hz.size()
struct Periodogram {
  std::vector<double> freqs_hz;
  std::vector<double> psd;  // units ~ (signal_unit^2 / Hz)

  size_t size() const { return freqs_hz.size(); }
  bool empty() const { return freqs_hz.empty(); }
};

// Raw EEG samples for one electrode, in arrival order.
struct EegPacket {
  int electrode{0};
  std::vector<double> samples;
};

// Raw PPG samples for one optical channel (0..2). The role of each channel
// (ambient/IR/red) is resolved through PpgSensorMapping.
struct PpgPacket {
  int ppg_channel{0};
  std::string label;
  std::vector<double> samples;
};

} // namespace biostream
