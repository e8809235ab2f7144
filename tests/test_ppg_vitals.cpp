#include "biostream/ppg_vitals.hpp"

#include "test_support.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace biostream;

static std::vector<double> pulse(double fs_hz, double seconds, double dc, double ac, double f_hz = 1.2) {
  const size_t n = static_cast<size_t>(std::llround(seconds * fs_hz));
  const double w = 2.0 * 3.141592653589793238462643383279502884 * f_hz;
  std::vector<double> x(n);
  for (size_t i = 0; i < n; ++i) x[i] = dc + ac * std::sin(w * static_cast<double>(i) / fs_hz);
  return x;
}

static std::vector<PpgChannelView> sensor(double fs_hz, double seconds, double red_ac = 240.0) {
  return {
      PpgChannelView{0, "AMBIENT", std::vector<double>(static_cast<size_t>(seconds * fs_hz), 1000.0)},
      PpgChannelView{1, "IR", pulse(fs_hz, seconds, 40000.0, 800.0)},
      PpgChannelView{2, "RED", pulse(fs_hz, seconds, 20000.0, red_ac)},
  };
}

int main() {
  const double fs = 64.0;
  const PpgVitalsOptions opt;

  // 1.2 Hz for 8 s => 72 bpm.
  {
    const auto hr = compute_heart_rate_bpm(pulse(fs, 8.0, 0.0, 1.0), fs, opt);
    assert(hr.has_value());
    if (std::abs(*hr - 72) > 2) {
      std::cerr << "Heart rate " << *hr << " bpm for a 1.2 Hz pulse\n";
      return 1;
    }

    const auto hr90 = compute_heart_rate_bpm(pulse(fs, 10.0, 500.0, 3.0, 1.5), fs, opt);
    assert(hr90 && std::abs(*hr90 - 90) <= 2);

    // Shorter than the minimum signal length.
    assert(!compute_heart_rate_bpm(pulse(fs, 2.0, 0.0, 1.0), fs, opt));
    // Flat signal: no peaks.
    assert(!compute_heart_rate_bpm(std::vector<double>(512, 7.0), fs, opt));
  }

  // SpO2 models stay inside [80, 100].
  {
    assert(spo2_from_ratio(0.0, opt) == 100.0);
    assert(spo2_from_ratio(2.0, opt) == 80.0);
    assert(biostream_test::approx(spo2_from_ratio(0.6, opt), 95.0));
    for (double r = -5.0; r <= 5.0; r += 0.25) {
      const double v = spo2_from_ratio(r, opt);
      assert(v >= 80.0 && v <= 100.0);
    }

    PpgVitalsOptions quad = opt;
    quad.spo2_model = Spo2Model::Quadratic;
    assert(biostream_test::approx(spo2_from_ratio(0.5, quad), -45.060 * 0.25 + 30.354 * 0.5 + 94.845));
    assert(spo2_from_ratio(3.0, quad) == 80.0);
  }

  // Ratio-of-ratios and the reason codes.
  {
    const auto ok = estimate_spo2(sensor(fs, 8.0), fs, opt);
    assert(ok && ok->ok);
    assert(ok->reason == VitalsReason::Ok);
    assert(ok->ratio && std::fabs(*ok->ratio - 0.6) < 0.01);
    assert(ok->spo2 && std::fabs(*ok->spo2 - 95.0) < 0.5);
    assert(ok->ir_label == "IR" && ok->red_label == "RED");

    // Shorter than the window, or a missing channel: no estimate.
    assert(!estimate_spo2(sensor(fs, 4.0), fs, opt));
    assert(!estimate_spo2({PpgChannelView{1, "IR", pulse(fs, 8.0, 40000.0, 800.0)}}, fs, opt));

    std::vector<PpgChannelView> dark = sensor(fs, 8.0);
    dark[1].samples.assign(dark[1].samples.size(), 0.0);
    assert(estimate_spo2(dark, fs, opt)->reason == VitalsReason::DcZero);

    std::vector<PpgChannelView> flat = sensor(fs, 8.0);
    flat[1].samples.assign(flat[1].samples.size(), 40000.0);
    const auto ac = estimate_spo2(flat, fs, opt);
    assert(ac->reason == VitalsReason::AcZero);
    assert(!ac->ok && !ac->spo2);
    assert(ac->perfusion_index_ir && *ac->perfusion_index_ir == 0.0);

    // A non-finite sample is not a dark sensor.
    std::vector<PpgChannelView> glitch = sensor(fs, 8.0);
    glitch[1].samples[glitch[1].samples.size() / 2] = std::nan("");
    const auto nan_pi = estimate_spo2(glitch, fs, opt);
    assert(nan_pi && nan_pi->reason == VitalsReason::PiNan);
    assert(!nan_pi->ok && !nan_pi->spo2 && !nan_pi->perfusion_index_ir);
    assert(std::string(vitals_reason_name(VitalsReason::PiNan)) == "PI_NAN");
    assert(std::isnan(compute_perfusion(glitch[1].samples, fs, opt).dc_mean));

    std::vector<PpgChannelView> weak = sensor(fs, 8.0);
    weak[1].samples = pulse(fs, 8.0, 40000.0, 10.0);
    const auto low = estimate_spo2(weak, fs, opt);
    assert(low->reason == VitalsReason::PiLow);
    assert(low->ratio.has_value());
    assert(!low->spo2);

    assert(std::string(vitals_reason_name(VitalsReason::PiLow)) == "PI_LOW");
    assert(std::string(vitals_reason_name(VitalsReason::NoSignal)) == "NO_SIGNAL");
  }

  // Pulse channel stickiness.
  {
    const std::vector<PpgChannelView> ch = {
        PpgChannelView{1, "IR", pulse(fs, 8.0, 40000.0, 800.0)},
        PpgChannelView{2, "RED", pulse(fs, 8.0, 20000.0, 100.0)},
    };

    const PulseResolution first = resolve_pulse_selection(ch, fs, PulseSelection{}, 1000, opt);
    assert(first.selected && *first.selected == 0);
    assert(first.next.channel_id == 1 && first.next.selected_at == 1000);

    const PulseSelection prev{2, "RED", 5.0, 0};
    const PulseResolution held = resolve_pulse_selection(ch, fs, prev, 5000, opt);
    assert(held.selected && *held.selected == 1);
    assert(held.quality == 5.0);
    assert(held.next.channel_id == 2 && held.next.selected_at == 0);

    const PulseResolution switched = resolve_pulse_selection(ch, fs, prev, 12000, opt);
    assert(switched.selected && *switched.selected == 0);
    assert(switched.next.channel_id == 1 && switched.next.selected_at == 12000);

    // The previous channel vanished: switch immediately.
    const PulseSelection gone{0, "AMBIENT", 1.0, 4000};
    const PulseResolution moved = resolve_pulse_selection(ch, fs, gone, 5000, opt);
    assert(moved.next.channel_id == 1);
  }

  // Helpers.
  {
    const std::vector<PpgChannelView> ch = {
        PpgChannelView{1, "IR", {1, 2, 3, 4}},
        PpgChannelView{2, "RED", {10, 20}},
    };
    const auto combined = build_combined_ppg(ch, 10);
    assert(combined.size() == 2);
    assert(combined[0] == 6.5 && combined[1] == 12.0);
    assert(build_combined_ppg({}, 10).empty());

    PpgVitalsOptions only_ir = opt;
    only_ir.enabled_labels = {"IR"};
    const auto enabled = filter_enabled_channels(sensor(fs, 1.0), only_ir);
    assert(enabled.size() == 1 && enabled[0].channel_id == 1);
    assert(exclude_ambient(sensor(fs, 1.0), opt.mapping).size() == 2);

    const auto card = build_cardiogram(pulse(fs, 8.0, 0.0, 1.0), fs, opt);
    assert(!card.empty());
    assert(card.size() <= 512);
  }

  // Estimator: EMA across updates, NO_DATA, NO_SIGNAL.
  {
    PpgVitalsEstimator est(fs, opt);
    PpgVitalsState state;

    const HeartVitals v1 = est.compute(sensor(fs, 10.0), &state, 1000);
    assert(v1.ok && v1.reason == VitalsReason::Ok);
    assert(v1.heart_rate_bpm && std::abs(*v1.heart_rate_bpm - 72) <= 2);
    assert(v1.spo2 && std::fabs(*v1.spo2 - 95.0) < 0.5);
    assert(v1.pulse_channel_id && *v1.pulse_channel_id == 1);
    assert(v1.pulse_channel_label == "IR");
    assert(!v1.combined_ppg.empty());
    assert(!v1.cardiogram.empty());

    // Ratio 0.8 => 90 %; EMA(0.2) moves one fifth of the way.
    const HeartVitals v2 = est.compute(sensor(fs, 10.0, 320.0), &state, 1500);
    assert(v2.ok);
    assert(v2.spo2 && std::fabs(*v2.spo2 - (*v1.spo2 + 0.2 * (90.0 - *v1.spo2))) < 0.3);

    // Red missing: heart rate still computed, SpO2 keeps the smoothed value.
    std::vector<PpgChannelView> no_red = sensor(fs, 10.0);
    no_red.pop_back();
    const HeartVitals v3 = est.compute(no_red, &state, 2000);
    assert(!v3.ok && v3.reason == VitalsReason::NoData);
    assert(v3.heart_rate_bpm.has_value());
    assert(v3.spo2 && *v3.spo2 == *v2.spo2);

    // Nothing at all: NO_SIGNAL and the state is reset.
    const HeartVitals v4 = est.compute({}, &state, 2500);
    assert(v4.reason == VitalsReason::NoSignal);
    assert(!v4.ok && !v4.spo2 && !v4.heart_rate_bpm);
    assert(!state.selection.valid());
    assert(!state.spo2_ema.has_value());

    // Channels outside 0..2 are ignored.
    const HeartVitals v5 = est.compute({PpgChannelView{5, "X", pulse(fs, 10.0, 100.0, 5.0)}}, &state, 3000);
    assert(v5.reason == VitalsReason::NoSignal);
  }

  {
    bool threw = false;
    try {
      PpgVitalsEstimator bad(0.0, opt);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_ppg_vitals OK\n";
  return 0;
}
