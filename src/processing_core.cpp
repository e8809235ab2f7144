#include "biostream/processing_core.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace biostream {

static PipelineConfig validated(PipelineConfig cfg) {
  validate_pipeline_config(cfg);
  return cfg;
}

static PpgVitalsOptions vitals_options(const PipelineConfig& cfg) {
  PpgVitalsOptions opt = cfg.ppg;
  opt.trace_window = cfg.ppg_trace_window;
  return opt;
}

ProcessingCore::ProcessingCore(PipelineConfig cfg)
    : cfg_(validated(std::move(cfg))),
      bands_(cfg_.band),
      vitals_(cfg_.ppg_fs_hz, vitals_options(cfg_)),
      spectrogram_(cfg_.eeg_fs_hz, cfg_.spectrogram) {
  vitals_state_.spo2_ema.set_alpha(cfg_.ppg.spo2_ema_alpha);
  if (!cfg_.channel_labels.empty()) apply_channel_map(cfg_.channel_labels);
}

bool ProcessingCore::due(const std::optional<TimestampMs>& last, int64_t interval_ms, TimestampMs now) {
  return !last || now - *last >= interval_ms;
}

void ProcessingCore::apply_channel_map(const std::vector<std::string>& labels) {
  if (labels.empty()) return;
  table_.apply_channel_map(labels);
  for (size_t i = 0; i < labels.size(); ++i) {
    eeg_channel(static_cast<int>(i));
  }
}

ProcessingCore::EegChannelState& ProcessingCore::eeg_channel(int index) {
  auto it = eeg_.find(index);
  if (it == eeg_.end()) {
    table_.ensure(index);
    it = eeg_.emplace(std::piecewise_construct,
                      std::forward_as_tuple(index),
                      std::forward_as_tuple(eeg_buffer_capacity(cfg_), cfg_.averager_count,
                                            cfg_.spectrogram.window_sec))
             .first;
  }
  return it->second;
}

void ProcessingCore::ingest(const EegPacket& packet) {
  if (packet.electrode < 0) throw std::runtime_error("ProcessingCore::ingest: negative electrode index");
  eeg_channel(packet.electrode).buffer.append(packet.samples);
}

bool ProcessingCore::ingest(const PpgPacket& packet) {
  if (packet.ppg_channel < 0 || packet.ppg_channel > 2) return false;

  auto it = ppg_.find(packet.ppg_channel);
  if (it == ppg_.end()) {
    it = ppg_.emplace(packet.ppg_channel, PpgChannelState(ppg_buffer_capacity(cfg_))).first;
    it->second.label = "PPG" + std::to_string(packet.ppg_channel + 1);
  }
  if (!packet.label.empty()) it->second.label = packet.label;
  it->second.buffer.append(packet.samples);
  return true;
}

void ProcessingCore::run_spectral_stage(TimestampMs now, TickResult* out) {
  const size_t n = cfg_.spectral.fft_window;

  std::vector<BandPowerSnapshot> snapshots;
  for (auto& kv : eeg_) {
    EegChannelState& ch = kv.second;
    const std::string label = table_.label(kv.first);

    if (ch.buffer.size() >= n && ch.buffer.total_appended() != ch.last_computed_total) {
      Periodogram p = compute_periodogram(ch.buffer.tail(n), cfg_.eeg_fs_hz, cfg_.spectral);
      ch.last_computed_total = ch.buffer.total_appended();

      // Spectrogram columns take this tick's periodogram.
      const Periodogram shown = restrict_to_max_freq(p, cfg_.spectrogram.max_freq_hz);
      ch.slices.push(SpectrogramSlice{shown.freqs_hz, shown.psd, now});

      ch.averager.push(std::move(p));
      ch.averaged = ch.averager.average();
    }

    ch.artifacts = detect_artifacts(ch.buffer.tail(cfg_.eeg_trace_window), cfg_.eeg_fs_hz, cfg_.artifacts);

    if (ch.averaged) snapshots.push_back(compute_band_powers(label, *ch.averaged));
  }

  out->bandpower_changed = bands_.update(snapshots, now);
}

void ProcessingCore::run_vitals_stage(TimestampMs now) {
  std::vector<PpgChannelView> views;
  views.reserve(ppg_.size());
  for (const auto& kv : ppg_) {
    if (kv.second.buffer.empty()) continue;
    views.push_back(PpgChannelView{kv.first, kv.second.label, kv.second.buffer.snapshot()});
  }
  last_vitals_ = vitals_.compute(views, &vitals_state_, now);
}

void ProcessingCore::publish_raw(TickResult* out) const {
  for (const auto& kv : eeg_) {
    out->eeg_traces.push_back(RawTrace{kv.first, table_.label(kv.first),
                                       kv.second.buffer.tail(cfg_.eeg_trace_window)});
  }
  for (const auto& kv : ppg_) {
    out->ppg_traces.push_back(RawTrace{kv.first, kv.second.label,
                                       kv.second.buffer.tail(cfg_.ppg_trace_window)});
  }
}

void ProcessingCore::fill_outputs(TickResult* out) const {
  for (const auto& kv : eeg_) {
    const EegChannelState& ch = kv.second;
    EegChannelOutput o;
    o.index = kv.first;
    o.label = table_.label(kv.first);
    o.buffered_samples = ch.buffer.size();
    o.averaged_periodogram = ch.averaged;
    o.spectrogram_slices.assign(ch.slices.slices().begin(), ch.slices.slices().end());
    o.artifacts = ch.artifacts;
    out->eeg.push_back(std::move(o));
  }

  out->band_snapshots = bands_.snapshots();
  for (const auto& label : bands_.history_labels()) {
    for (const auto& def : standard_bands()) {
      const BandHistory* h = bands_.history(label, def.band);
      if (!h) continue;
      BandSeries s;
      s.label = label;
      s.band = def.band;
      s.points.assign(h->points().begin(), h->points().end());
      s.smoothed = h->smoothed();
      out->band_history.push_back(std::move(s));
    }
  }

  out->vitals = last_vitals_;
}

TickResult ProcessingCore::tick(TimestampMs now) {
  TickResult out;
  out.now = now;

  if (due(last_compute_, cfg_.compute_interval_ms, now)) {
    last_compute_ = now;
    out.computed = true;
    run_spectral_stage(now, &out);
  }

  if (due(last_vitals_at_, cfg_.vitals_interval_ms, now)) {
    last_vitals_at_ = now;
    out.vitals_updated = true;
    run_vitals_stage(now);
  }

  if (due(last_republish_, cfg_.republish_interval_ms, now)) {
    last_republish_ = now;
    out.raw_published = true;
    publish_raw(&out);
  }

  fill_outputs(&out);
  return out;
}

SpectrogramImage ProcessingCore::build_spectrogram(const std::vector<std::string>& labels, TimestampMs now) {
  std::vector<SpectrogramInput> inputs;
  for (const auto& kv : eeg_) {
    const std::string label = table_.label(kv.first);
    if (!labels.empty() && std::find(labels.begin(), labels.end(), label) == labels.end()) continue;

    SpectrogramInput in;
    in.label = label;
    in.samples = kv.second.buffer.snapshot();
    in.cached_slices = kv.second.slices.in_window(now);
    inputs.push_back(std::move(in));
  }
  return spectrogram_.build(inputs, now);
}

std::vector<RawTrace> ProcessingCore::export_window() const {
  std::vector<RawTrace> out;
  const size_t n = seconds_to_samples(static_cast<double>(cfg_.auto_export_ms) / 1000.0, cfg_.eeg_fs_hz);
  if (n == 0) return out;
  for (const auto& kv : eeg_) {
    out.push_back(RawTrace{kv.first, table_.label(kv.first), kv.second.buffer.tail(n)});
  }
  return out;
}

void ProcessingCore::reset() {
  eeg_.clear();
  ppg_.clear();
  table_.clear();
  bands_.clear();
  vitals_state_.reset();
  last_vitals_.reset();
  last_compute_.reset();
  last_vitals_at_.reset();
  last_republish_.reset();
}

} // namespace biostream
