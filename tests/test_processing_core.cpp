#include "biostream/processing_core.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace biostream;

static std::vector<double> tone(double fs_hz, double f_hz, size_t n, size_t offset, double dc, double amp) {
  const double w = 2.0 * 3.141592653589793238462643383279502884 * f_hz;
  std::vector<double> x(n);
  for (size_t i = 0; i < n; ++i) x[i] = dc + amp * std::sin(w * static_cast<double>(offset + i) / fs_hz);
  return x;
}

static bool has_snapshot(const TickResult& r, const std::string& label) {
  return std::any_of(r.band_snapshots.begin(), r.band_snapshots.end(),
                     [&](const BandPowerSnapshot& s) { return s.label == label; });
}

static void feed_eeg(ProcessingCore* core, size_t n, size_t offset, double f_hz = 10.0) {
  for (int ch = 0; ch < 4; ++ch) {
    core->ingest(EegPacket{ch, tone(256.0, f_hz, n, offset, 0.0, 20.0)});
  }
}

int main() {
  PipelineConfig cfg;
  cfg.spectral.fft_window = 256;
  cfg.channel_labels = {"TP9", "AF7", "AF8", "TP10"};

  // Cadence of the stages.
  {
    ProcessingCore core(cfg);
    assert(core.channels().size() == 4);
    feed_eeg(&core, 512, 0);

    const TickResult r1 = core.tick(1000);
    assert(r1.computed && r1.vitals_updated && r1.raw_published);
    assert(r1.bandpower_changed);
    assert(r1.eeg.size() == 4);
    assert(r1.eeg[0].label == "TP9");
    assert(r1.eeg[0].buffered_samples == 512);
    assert(r1.eeg[0].averaged_periodogram.has_value());
    assert(r1.eeg[0].spectrogram_slices.size() == 1);
    assert(r1.eeg[0].artifacts.latest && !r1.eeg[0].artifacts.latest->any());
    assert(r1.eeg_traces.size() == 4 && r1.eeg_traces[0].samples.size() == 512);

    assert(has_snapshot(r1, "TP9") && has_snapshot(r1, "ALL"));
    assert(has_snapshot(r1, "PAIR_TP9_10") && has_snapshot(r1, "PAIR_AF7_8"));
    assert(has_snapshot(r1, "LEFT") && has_snapshot(r1, "RIGHT"));
    for (const auto& s : r1.band_snapshots) {
      assert(s.at(Band::Alpha).relative > 0.9);
    }
    assert(!r1.band_history.empty());

    // No PPG yet.
    assert(r1.vitals && r1.vitals->reason == VitalsReason::NoSignal);

    const TickResult r2 = core.tick(1100);
    assert(!r2.computed && !r2.vitals_updated && !r2.raw_published);
    assert(r2.eeg_traces.empty());
    assert(r2.eeg.size() == 4);  // latest results are still reported

    const TickResult r3 = core.tick(1200);
    assert(r3.raw_published && !r3.computed);

    // Due again, but no new samples: nothing recomputed, no history point.
    const TickResult r4 = core.tick(2000);
    assert(r4.computed);
    assert(!r4.bandpower_changed);
    assert(r4.eeg[0].spectrogram_slices.size() == 1);

    // One cached slice: the spectrogram falls back to an STFT per channel.
    const SpectrogramImage img1 = core.build_spectrogram({}, 2000);
    assert(img1.source == SpectrogramSource::Stft);
    assert(core.stft_invocations() == 4);

    feed_eeg(&core, 256, 512, 11.0);
    const TickResult r5 = core.tick(3000);
    assert(r5.computed);
    assert(r5.eeg[0].spectrogram_slices.size() == 2);

    // Two cached slices: no new STFT.
    const SpectrogramImage img2 = core.build_spectrogram({"TP9", "AF7"}, 3000);
    assert(img2.source == SpectrogramSource::CachedSlices);
    assert(img2.channels.size() == 2);
    assert(core.stft_invocations() == 4);
    assert(img2.width == 2);
  }

  // Spectrogram columns follow the latest periodogram; the average lags behind.
  {
    PipelineConfig plain = cfg;
    plain.spectral.notch_enabled = false;
    ProcessingCore core(plain);

    feed_eeg(&core, 256, 0, 10.0);
    (void)core.tick(1000);
    feed_eeg(&core, 256, 256, 20.0);
    const TickResult r = core.tick(2000);

    const auto psd_at = [](const std::vector<double>& freqs, const std::vector<double>& psd, double f) {
      for (size_t i = 0; i < freqs.size(); ++i) {
        if (std::fabs(freqs[i] - f) < 1e-9) return psd[i];
      }
      return std::nan("");
    };

    const auto& slices = r.eeg[0].spectrogram_slices;
    assert(slices.size() == 2);
    const SpectrogramSlice& newest = slices.back();
    assert(newest.t == 2000);
    const double p10 = psd_at(newest.freqs_hz, newest.psd, 10.0);
    const double p20 = psd_at(newest.freqs_hz, newest.psd, 20.0);
    assert(p20 > 0.0);
    assert(p10 < 1e-3 * p20);

    const Periodogram& avg = *r.eeg[0].averaged_periodogram;
    assert(psd_at(avg.freqs_hz, avg.psd, 10.0) > 0.4 * psd_at(avg.freqs_hz, avg.psd, 20.0));
  }

  // PPG routing and vitals.
  {
    ProcessingCore core(cfg);
    assert(!core.ingest(PpgPacket{3, "X", {1.0, 2.0}}));
    assert(!core.ingest(PpgPacket{-1, "X", {1.0}}));

    const size_t n = 640;  // 10 s at 64 Hz
    assert(core.ingest(PpgPacket{0, "", std::vector<double>(n, 1000.0)}));
    assert(core.ingest(PpgPacket{1, "IR", tone(64.0, 1.2, n, 0, 40000.0, 800.0)}));
    assert(core.ingest(PpgPacket{2, "RED", tone(64.0, 1.2, n, 0, 20000.0, 240.0)}));

    const TickResult r = core.tick(10000);
    assert(r.vitals);
    assert(r.vitals->ok);
    assert(r.vitals->heart_rate_bpm && std::abs(*r.vitals->heart_rate_bpm - 72) <= 2);
    assert(r.vitals->spo2 && std::fabs(*r.vitals->spo2 - 95.0) < 0.5);
    assert(r.vitals->pulse_channel_label == "IR");
    assert(r.ppg_traces.size() == 3);
    assert(r.ppg_traces[0].label == "PPG1");
    assert(r.ppg_traces[1].samples.size() == n);
  }

  // Input validation, auto-export window and reset.
  {
    PipelineConfig exp = cfg;
    exp.auto_export_ms = 1000;
    ProcessingCore core(exp);

    bool threw = false;
    try {
      core.ingest(EegPacket{-1, {1.0}});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);

    feed_eeg(&core, 512, 0);
    const auto exported = core.export_window();
    assert(exported.size() == 4);
    assert(exported[0].samples.size() == 256);

    (void)core.tick(1000);
    core.reset();
    const TickResult r = core.tick(5000);
    assert(r.eeg.empty());
    assert(r.band_snapshots.empty());
    assert(r.vitals && r.vitals->reason == VitalsReason::NoSignal);
    assert(core.channels().empty());

    // Labels survive a reset.
    core.ingest(EegPacket{1, {0.0}});
    assert(core.channels().label(1) == "AF7");
  }

  {
    PipelineConfig bad = cfg;
    bad.eeg_fs_hz = 0.0;
    bool threw = false;
    try {
      ProcessingCore core(bad);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_processing_core OK\n";
  return 0;
}
