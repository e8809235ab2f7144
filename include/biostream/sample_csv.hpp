#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace biostream {

// Column-oriented samples read from a delimited text file.
struct SampleTable {
  std::vector<std::string> labels;
  std::vector<std::vector<double>> columns;  // columns[c][row]

  size_t n_channels() const { return labels.size(); }
  size_t n_rows() const { return columns.empty() ? 0 : columns.front().size(); }
};

// Read a CSV/TSV file whose header row names the channels and whose
// following rows hold one sample per channel.
//
// Notes:
// - The delimiter (',', ';' or tab) is detected from the header.
// - Lines starting with "#" or "//" are ignored.
// - A leading time/sample-index column ("time", "time_ms", "timestamp",
//   "sample", "t") is dropped.
// - Numbers are parsed in the classic "C" locale.
SampleTable read_sample_csv(const std::string& path);

} // namespace biostream
