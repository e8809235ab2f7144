#include "biostream/channel_table.hpp"

#include "biostream/utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace biostream {

Hemisphere infer_hemisphere(const std::string& label) {
  const std::string s = to_upper(trim(label));
  if (s.empty()) return Hemisphere::None;

  if (ends_with(s, "L") || s.find("AUXL") != std::string::npos) return Hemisphere::Left;
  if (ends_with(s, "R") || s.find("AUXR") != std::string::npos) return Hemisphere::Right;
  if (ends_with(s, "Z")) return Hemisphere::None;

  size_t b = s.size();
  while (b > 0 && std::isdigit(static_cast<unsigned char>(s[b - 1]))) --b;
  if (b == s.size()) return Hemisphere::None;

  // Only the parity matters, so the last digit is enough.
  const int last = s.back() - '0';
  return (last % 2 == 1) ? Hemisphere::Left : Hemisphere::Right;
}

bool is_aux_label(const std::string& label) {
  return starts_with(to_upper(trim(label)), "AUX");
}

std::vector<std::string> default_headband_labels() {
  return {"TP9", "AF7", "AF8", "TP10", "AUXL", "AUXR"};
}

void ChannelTable::apply_channel_map(const std::vector<std::string>& labels) {
  map_ = labels;
  for (size_t i = 0; i < labels.size(); ++i) {
    ensure(static_cast<int>(i));
  }
  for (auto& ch : channels_) {
    ch.label = label(ch.index);
  }
}

size_t ChannelTable::ensure(int index) {
  if (index < 0) throw std::runtime_error("ChannelTable::ensure: negative channel index");
  auto it = std::lower_bound(channels_.begin(), channels_.end(), index,
                             [](const Channel& c, int v) { return c.index < v; });
  if (it != channels_.end() && it->index == index) {
    return static_cast<size_t>(it - channels_.begin());
  }
  Channel ch;
  ch.index = index;
  ch.label = label(index);
  it = channels_.insert(it, ch);
  return static_cast<size_t>(it - channels_.begin());
}

std::optional<size_t> ChannelTable::find(int index) const {
  for (size_t i = 0; i < channels_.size(); ++i) {
    if (channels_[i].index == index) return i;
  }
  return std::nullopt;
}

std::optional<size_t> ChannelTable::find_label(const std::string& label) const {
  for (size_t i = 0; i < channels_.size(); ++i) {
    if (channels_[i].label == label) return i;
  }
  return std::nullopt;
}

std::string ChannelTable::label(int index) const {
  if (index >= 0 && static_cast<size_t>(index) < map_.size() && !map_[static_cast<size_t>(index)].empty()) {
    return map_[static_cast<size_t>(index)];
  }
  return "CH " + std::to_string(index);
}

} // namespace biostream
