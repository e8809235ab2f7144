#pragma once

#include "biostream/artifacts.hpp"
#include "biostream/bandpower.hpp"
#include "biostream/periodogram.hpp"
#include "biostream/ppg_vitals.hpp"
#include "biostream/spectrogram.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace biostream {

// Every tunable of the processing pipeline.
struct PipelineConfig {
  double eeg_fs_hz{256.0};
  double ppg_fs_hz{64.0};

  // EEG index -> label binding applied at session start.
  std::vector<std::string> channel_labels;

  SpectralOptions spectral;
  size_t averager_count{4};

  // Samples kept for display/export.
  size_t eeg_trace_window{4096};
  size_t ppg_trace_window{1024};
  int64_t auto_export_ms{0};

  // 0 derives the capacity from the consumers (see eeg_buffer_capacity()).
  size_t eeg_buffer_capacity{0};
  size_t ppg_buffer_capacity{0};

  int64_t compute_interval_ms{1000};
  int64_t republish_interval_ms{200};
  int64_t vitals_interval_ms{500};

  BandPowerOptions band;
  SpectrogramOptions spectrogram;
  ArtifactOptions artifacts;
  PpgVitalsOptions ppg;
};

// Effective buffer capacities (explicit value or the derived minimum).
size_t eeg_buffer_capacity(const PipelineConfig& cfg);
size_t ppg_buffer_capacity(const PipelineConfig& cfg);

// Set one option by key. Throws std::runtime_error on unknown keys or
// unparsable values.
void apply_config_value(PipelineConfig* cfg, const std::string& key, const std::string& value);

// Load "key=value" lines on top of `base`. Empty lines and lines starting
// with '#' are ignored.
PipelineConfig load_pipeline_config(const std::string& path, PipelineConfig base = PipelineConfig{});

// Throws std::runtime_error describing the first inconsistency found.
void validate_pipeline_config(const PipelineConfig& cfg);

// The configuration as "key=value" lines, loadable by load_pipeline_config().
std::string format_pipeline_config(const PipelineConfig& cfg);

} // namespace biostream
