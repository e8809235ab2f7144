#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace biostream {

// Windowed artifact flags over a trailing trace of raw (unfiltered) EEG.
//
// A threshold <= 0 disables the corresponding flag.
struct ArtifactOptions {
  double window_sec{1.0};
  double step_sec{0.5};

  // Peak-to-peak amplitude (signal units, e.g. uV).
  double amplitude_range_threshold{150.0};

  // Mains interference: power within +/- band/2 of line_noise_hz, relative
  // to the total power in [0.5, line_noise_max_hz].
  double line_noise_hz{60.0};
  double line_noise_band_hz{2.0};
  double line_noise_max_hz{100.0};
  double line_noise_ratio_threshold{0.2};
};

struct ArtifactWindow {
  size_t start_sample{0};  // inclusive, index into the analyzed trace
  size_t end_sample{0};    // exclusive
  double amplitude_range{0.0};
  double line_noise_ratio{0.0};
  bool amplitude_artifact{false};
  bool line_noise_artifact{false};

  bool any() const { return amplitude_artifact || line_noise_artifact; }
};

struct ArtifactReport {
  std::vector<ArtifactWindow> windows;
  std::optional<ArtifactWindow> latest;

  size_t count_flagged() const;
};

// Fraction of power near the line frequency. Bins below 0.5 Hz and above
// max_hz are ignored; 0 when fewer than 8 samples or no power.
double line_noise_ratio(const std::vector<double>& x,
                        double fs_hz,
                        double line_hz,
                        double band_hz,
                        double max_hz);

// Slide the analysis window over `trace`. Empty report when the trace is
// shorter than one window.
ArtifactReport detect_artifacts(const std::vector<double>& trace,
                                double fs_hz,
                                const ArtifactOptions& opt);

} // namespace biostream
