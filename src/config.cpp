#include "biostream/config.hpp"

#include "biostream/sample_buffer.hpp"
#include "biostream/utils.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace biostream {

size_t eeg_buffer_capacity(const PipelineConfig& cfg) {
  if (cfg.eeg_buffer_capacity > 0) return cfg.eeg_buffer_capacity;
  const size_t export_samples = seconds_to_samples(static_cast<double>(cfg.auto_export_ms) / 1000.0, cfg.eeg_fs_hz);
  return required_eeg_capacity(cfg.eeg_trace_window, cfg.spectral.fft_window, export_samples);
}

size_t ppg_buffer_capacity(const PipelineConfig& cfg) {
  if (cfg.ppg_buffer_capacity > 0) return cfg.ppg_buffer_capacity;
  const size_t export_samples = seconds_to_samples(static_cast<double>(cfg.auto_export_ms) / 1000.0, cfg.ppg_fs_hz);
  const size_t vitals_samples = seconds_to_samples(cfg.ppg.window_sec, cfg.ppg_fs_hz);
  return required_ppg_capacity(cfg.ppg_trace_window, export_samples, vitals_samples);
}

static size_t to_size(const std::string& key, const std::string& value) {
  const int v = to_int(value);
  if (v < 0) throw std::runtime_error("apply_config_value: " + key + " must be >= 0");
  return static_cast<size_t>(v);
}

static std::vector<std::string> to_list(const std::string& value) {
  std::vector<std::string> out;
  for (const auto& part : split(value, ',')) {
    const std::string t = trim(part);
    if (!t.empty()) out.push_back(t);
  }
  return out;
}

static Spo2Model to_spo2_model(const std::string& value) {
  const std::string v = to_lower(trim(value));
  if (v == "linear") return Spo2Model::Linear;
  if (v == "quadratic") return Spo2Model::Quadratic;
  throw std::runtime_error("apply_config_value: spo2_model must be 'linear' or 'quadratic'");
}

void apply_config_value(PipelineConfig* cfg, const std::string& key_in, const std::string& value) {
  if (!cfg) throw std::runtime_error("apply_config_value: cfg is null");
  const std::string key = to_lower(trim(key_in));
  PipelineConfig& c = *cfg;

  if (key == "eeg_fs_hz") c.eeg_fs_hz = to_double(value);
  else if (key == "ppg_fs_hz") c.ppg_fs_hz = to_double(value);
  else if (key == "channel_labels") c.channel_labels = to_list(value);
  else if (key == "fft_window") c.spectral.fft_window = to_size(key, value);
  else if (key == "notch_enabled") c.spectral.notch_enabled = to_bool(value);
  else if (key == "notch_hz") c.spectral.notch_hz = to_double(value);
  else if (key == "notch_q") c.spectral.notch_q = to_double(value);
  else if (key == "averager_count") c.averager_count = to_size(key, value);
  else if (key == "eeg_trace_window") c.eeg_trace_window = to_size(key, value);
  else if (key == "ppg_trace_window") c.ppg_trace_window = to_size(key, value);
  else if (key == "auto_export_ms") c.auto_export_ms = to_int(value);
  else if (key == "eeg_buffer_capacity") c.eeg_buffer_capacity = to_size(key, value);
  else if (key == "ppg_buffer_capacity") c.ppg_buffer_capacity = to_size(key, value);
  else if (key == "compute_interval_ms") c.compute_interval_ms = to_int(value);
  else if (key == "republish_interval_ms") c.republish_interval_ms = to_int(value);
  else if (key == "vitals_interval_ms") c.vitals_interval_ms = to_int(value);
  else if (key == "band_window_sec") c.band.history_window_sec = to_double(value);
  else if (key == "band_smoothing_sec") c.band.smoothing_window_sec = to_double(value);
  else if (key == "band_default_aggregates") c.band.use_default_aggregates = to_bool(value);
  else if (key == "spectrogram_window_sec") c.spectrogram.window_sec = to_double(value);
  else if (key == "spectrogram_max_freq_hz") c.spectrogram.max_freq_hz = to_double(value);
  else if (key == "spectrogram_rows_per_channel") c.spectrogram.raster_rows_per_channel = to_size(key, value);
  else if (key == "artifact_window_sec") c.artifacts.window_sec = to_double(value);
  else if (key == "artifact_step_sec") c.artifacts.step_sec = to_double(value);
  else if (key == "amplitude_range_threshold") c.artifacts.amplitude_range_threshold = to_double(value);
  else if (key == "line_noise_hz") c.artifacts.line_noise_hz = to_double(value);
  else if (key == "line_noise_band_hz") c.artifacts.line_noise_band_hz = to_double(value);
  else if (key == "line_noise_max_hz") c.artifacts.line_noise_max_hz = to_double(value);
  else if (key == "line_noise_ratio_threshold") c.artifacts.line_noise_ratio_threshold = to_double(value);
  else if (key == "ppg_window_sec") c.ppg.window_sec = to_double(value);
  else if (key == "ppg_min_perfusion_index") c.ppg.min_perfusion_index = to_double(value);
  else if (key == "pulse_debounce_ms") c.ppg.pulse_debounce_ms = to_int(value);
  else if (key == "spo2_ema_alpha") c.ppg.spo2_ema_alpha = to_double(value);
  else if (key == "spo2_model") c.ppg.spo2_model = to_spo2_model(value);
  else if (key == "spo2_intercept") c.ppg.spo2_intercept = to_double(value);
  else if (key == "spo2_slope") c.ppg.spo2_slope = to_double(value);
  else if (key == "ppg_ambient_channel") c.ppg.mapping.ambient_channel = to_int(value);
  else if (key == "ppg_ir_channel") c.ppg.mapping.ir_channel = to_int(value);
  else if (key == "ppg_red_channel") c.ppg.mapping.red_channel = to_int(value);
  else if (key == "ppg_enabled_labels") c.ppg.enabled_labels = to_list(value);
  else throw std::runtime_error("apply_config_value: unknown key '" + key_in + "'");
}

PipelineConfig load_pipeline_config(const std::string& path, PipelineConfig base) {
  std::ifstream f(std::filesystem::u8path(path));
  if (!f) throw std::runtime_error("load_pipeline_config: failed to open: " + path);

  std::string line;
  size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;

    const size_t eq = t.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("load_pipeline_config: " + path + ":" + std::to_string(lineno) +
                               ": expected key=value");
    }
    try {
      apply_config_value(&base, t.substr(0, eq), t.substr(eq + 1));
    } catch (const std::exception& e) {
      throw std::runtime_error("load_pipeline_config: " + path + ":" + std::to_string(lineno) +
                               ": " + e.what());
    }
  }
  return base;
}

static void require(bool ok, const std::string& what) {
  if (!ok) throw std::runtime_error("validate_pipeline_config: " + what);
}

void validate_pipeline_config(const PipelineConfig& c) {
  require(c.eeg_fs_hz > 0.0, "eeg_fs_hz must be > 0");
  require(c.ppg_fs_hz > 0.0, "ppg_fs_hz must be > 0");
  require(c.spectral.fft_window >= 8, "fft_window must be >= 8");
  require(c.averager_count >= 1, "averager_count must be >= 1");
  require(c.eeg_trace_window >= 1, "eeg_trace_window must be >= 1");
  require(c.ppg_trace_window >= 1, "ppg_trace_window must be >= 1");
  require(c.auto_export_ms >= 0, "auto_export_ms must be >= 0");
  require(c.compute_interval_ms > 0, "compute_interval_ms must be > 0");
  require(c.republish_interval_ms > 0, "republish_interval_ms must be > 0");
  require(c.vitals_interval_ms > 0, "vitals_interval_ms must be > 0");

  const double eeg_nyq = 0.5 * c.eeg_fs_hz;
  const double ppg_nyq = 0.5 * c.ppg_fs_hz;

  if (c.spectral.notch_enabled) {
    require(c.spectral.notch_hz > 0.0 && c.spectral.notch_hz < eeg_nyq, "notch_hz must be in (0, eeg_fs/2)");
    require(c.spectral.notch_q > 0.0, "notch_q must be > 0");
  }

  // Buffer sizing.
  const size_t export_eeg = seconds_to_samples(static_cast<double>(c.auto_export_ms) / 1000.0, c.eeg_fs_hz);
  const size_t need_eeg = required_eeg_capacity(c.eeg_trace_window, c.spectral.fft_window, export_eeg);
  require(eeg_buffer_capacity(c) >= need_eeg,
          "eeg_buffer_capacity " + std::to_string(eeg_buffer_capacity(c)) + " is below the required " +
              std::to_string(need_eeg));
  const size_t export_ppg = seconds_to_samples(static_cast<double>(c.auto_export_ms) / 1000.0, c.ppg_fs_hz);
  const size_t need_ppg = required_ppg_capacity(c.ppg_trace_window, export_ppg,
                                                seconds_to_samples(c.ppg.window_sec, c.ppg_fs_hz));
  require(ppg_buffer_capacity(c) >= need_ppg,
          "ppg_buffer_capacity " + std::to_string(ppg_buffer_capacity(c)) + " is below the required " +
              std::to_string(need_ppg));

  require(c.band.history_window_sec > 0.0, "band_window_sec must be > 0");
  require(c.band.smoothing_window_sec > 0.0, "band_smoothing_sec must be > 0");

  require(c.spectrogram.window_sec > 0.0, "spectrogram_window_sec must be > 0");
  require(c.spectrogram.max_freq_hz > 0.0 && c.spectrogram.max_freq_hz <= eeg_nyq,
          "spectrogram_max_freq_hz must be in (0, eeg_fs/2]");

  require(c.artifacts.window_sec > 0.0, "artifact_window_sec must be > 0");
  require(c.artifacts.step_sec > 0.0, "artifact_step_sec must be > 0");
  require(c.artifacts.line_noise_band_hz >= 0.0, "line_noise_band_hz must be >= 0");

  require(c.ppg.window_sec > 0.0, "ppg_window_sec must be > 0");
  require(c.ppg.dc_lowpass_hz > 0.0 && c.ppg.dc_lowpass_hz < ppg_nyq, "PPG DC low-pass must be in (0, ppg_fs/2)");
  require(c.ppg.ac_low_hz > 0.0 && c.ppg.ac_low_hz < c.ppg.ac_high_hz, "PPG AC band must satisfy 0 < low < high");
  require(c.ppg.ac_high_hz < ppg_nyq, "PPG AC high cutoff must be < ppg_fs/2");
  require(c.ppg.min_perfusion_index >= 0.0, "ppg_min_perfusion_index must be >= 0");
  require(c.ppg.pulse_debounce_ms >= 0, "pulse_debounce_ms must be >= 0");
  require(c.ppg.spo2_ema_alpha > 0.0 && c.ppg.spo2_ema_alpha <= 1.0, "spo2_ema_alpha must be in (0, 1]");

  const PpgSensorMapping& m = c.ppg.mapping;
  for (int ch : {m.ambient_channel, m.ir_channel, m.red_channel}) {
    require(ch >= 0 && ch <= 2, "PPG channel mapping must use channels 0..2");
  }
  require(m.ambient_channel != m.ir_channel && m.ambient_channel != m.red_channel &&
              m.ir_channel != m.red_channel,
          "PPG channel mapping roles must use distinct channels");
}

static std::string join_list(const std::vector<std::string>& items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += ",";
    out += items[i];
  }
  return out;
}

std::string format_pipeline_config(const PipelineConfig& c) {
  std::ostringstream o;
  o.imbue(std::locale::classic());
  o << std::setprecision(12);

  o << "# biostream pipeline configuration\n";
  o << "eeg_fs_hz=" << c.eeg_fs_hz << "\n";
  o << "ppg_fs_hz=" << c.ppg_fs_hz << "\n";
  if (!c.channel_labels.empty()) o << "channel_labels=" << join_list(c.channel_labels) << "\n";
  o << "fft_window=" << c.spectral.fft_window << "\n";
  o << "notch_enabled=" << (c.spectral.notch_enabled ? "true" : "false") << "\n";
  o << "notch_hz=" << c.spectral.notch_hz << "\n";
  o << "notch_q=" << c.spectral.notch_q << "\n";
  o << "averager_count=" << c.averager_count << "\n";
  o << "eeg_trace_window=" << c.eeg_trace_window << "\n";
  o << "ppg_trace_window=" << c.ppg_trace_window << "\n";
  o << "auto_export_ms=" << c.auto_export_ms << "\n";
  o << "eeg_buffer_capacity=" << c.eeg_buffer_capacity << "\n";
  o << "ppg_buffer_capacity=" << c.ppg_buffer_capacity << "\n";
  o << "compute_interval_ms=" << c.compute_interval_ms << "\n";
  o << "republish_interval_ms=" << c.republish_interval_ms << "\n";
  o << "vitals_interval_ms=" << c.vitals_interval_ms << "\n";
  o << "band_window_sec=" << c.band.history_window_sec << "\n";
  o << "band_smoothing_sec=" << c.band.smoothing_window_sec << "\n";
  o << "band_default_aggregates=" << (c.band.use_default_aggregates ? "true" : "false") << "\n";
  o << "spectrogram_window_sec=" << c.spectrogram.window_sec << "\n";
  o << "spectrogram_max_freq_hz=" << c.spectrogram.max_freq_hz << "\n";
  o << "spectrogram_rows_per_channel=" << c.spectrogram.raster_rows_per_channel << "\n";
  o << "artifact_window_sec=" << c.artifacts.window_sec << "\n";
  o << "artifact_step_sec=" << c.artifacts.step_sec << "\n";
  o << "amplitude_range_threshold=" << c.artifacts.amplitude_range_threshold << "\n";
  o << "line_noise_hz=" << c.artifacts.line_noise_hz << "\n";
  o << "line_noise_band_hz=" << c.artifacts.line_noise_band_hz << "\n";
  o << "line_noise_max_hz=" << c.artifacts.line_noise_max_hz << "\n";
  o << "line_noise_ratio_threshold=" << c.artifacts.line_noise_ratio_threshold << "\n";
  o << "ppg_window_sec=" << c.ppg.window_sec << "\n";
  o << "ppg_min_perfusion_index=" << c.ppg.min_perfusion_index << "\n";
  o << "pulse_debounce_ms=" << c.ppg.pulse_debounce_ms << "\n";
  o << "spo2_ema_alpha=" << c.ppg.spo2_ema_alpha << "\n";
  o << "spo2_model=" << (c.ppg.spo2_model == Spo2Model::Quadratic ? "quadratic" : "linear") << "\n";
  o << "spo2_intercept=" << c.ppg.spo2_intercept << "\n";
  o << "spo2_slope=" << c.ppg.spo2_slope << "\n";
  o << "ppg_ambient_channel=" << c.ppg.mapping.ambient_channel << "\n";
  o << "ppg_ir_channel=" << c.ppg.mapping.ir_channel << "\n";
  o << "ppg_red_channel=" << c.ppg.mapping.red_channel << "\n";
  if (!c.ppg.enabled_labels.empty()) o << "ppg_enabled_labels=" << join_list(c.ppg.enabled_labels) << "\n";
  return o.str();
}

} // namespace biostream
