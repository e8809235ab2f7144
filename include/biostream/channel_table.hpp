#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace biostream {

struct Channel {
  int index{0};
  std::string label;
};

enum class Hemisphere { None, Left, Right };

// Infer the hemisphere from common 10-20 / headband naming:
// - trailing 'L' (or containing "AUXL") -> Left
// - trailing 'R' (or containing "AUXR") -> Right
// - trailing 'Z' -> None (midline)
// - trailing number: odd -> Left, even -> Right
// Matching is case-insensitive.
Hemisphere infer_hemisphere(const std::string& label);

// True for auxiliary inputs (labels starting with "AUX").
bool is_aux_label(const std::string& label);

// Labels used by a Muse-style headband, in electrode index order.
std::vector<std::string> default_headband_labels();

// Index-stable table of EEG channels.
//
// Channels are created on first sight of an electrode index and never
// removed during a session. Relabeling keeps the index order.
class ChannelTable {
public:
  ChannelTable() = default;

  // Bind labels to indices 0..labels.size()-1. Existing channels are
  // relabeled; missing ones are created.
  void apply_channel_map(const std::vector<std::string>& labels);

  // Ensure a channel exists for this index; returns its position in channels().
  size_t ensure(int index);

  std::optional<size_t> find(int index) const;
  std::optional<size_t> find_label(const std::string& label) const;

  // Label for an index ("CH <index>" when no map entry exists).
  std::string label(int index) const;

  const std::vector<Channel>& channels() const { return channels_; }
  size_t size() const { return channels_.size(); }
  bool empty() const { return channels_.empty(); }

  void clear() { channels_.clear(); }

private:
  std::vector<Channel> channels_;  // kept sorted by index
  std::vector<std::string> map_;
};

} // namespace biostream
