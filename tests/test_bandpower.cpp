#include "biostream/bandpower.hpp"
#include "biostream/periodogram.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace biostream;
using biostream_test::approx;

static BandPowerSnapshot snapshot(const std::string& label, double delta, double theta, double alpha,
                                  double beta, double gamma) {
  BandPowerSnapshot s;
  s.label = label;
  s.bands[band_index(Band::Delta)].absolute = delta;
  s.bands[band_index(Band::Theta)].absolute = theta;
  s.bands[band_index(Band::Alpha)].absolute = alpha;
  s.bands[band_index(Band::Beta)].absolute = beta;
  s.bands[band_index(Band::Gamma)].absolute = gamma;
  normalize_band_powers(&s);
  return s;
}

static double relative_sum(const BandPowerSnapshot& s) {
  double acc = 0.0;
  for (const auto& b : s.bands) acc += b.relative;
  return acc;
}

static const BandPowerSnapshot* find(const std::vector<BandPowerSnapshot>& v, const std::string& label) {
  auto it = std::find_if(v.begin(), v.end(), [&](const BandPowerSnapshot& s) { return s.label == label; });
  return it == v.end() ? nullptr : &*it;
}

static bool has_member(const AggregateDefinition& d, const std::string& m) {
  return std::find(d.members.begin(), d.members.end(), m) != d.members.end();
}

int main() {
  // Standard bands.
  {
    const auto& bands = standard_bands();
    assert(bands.size() == kNumBands);
    assert(bands[band_index(Band::Alpha)].fmin_hz == 8.0);
    assert(bands[band_index(Band::Alpha)].fmax_hz == 12.0);
    assert(std::string(band_name(Band::Gamma)) == "gamma");
  }

  // A 10 Hz sinusoid lands in alpha; relatives sum to 1.
  {
    const double fs = 256.0;
    std::vector<double> x(1024);
    for (size_t i = 0; i < x.size(); ++i) {
      x[i] = 10.0 * std::sin(2.0 * 3.14159265358979323846 * 10.0 * static_cast<double>(i) / fs);
    }
    SpectralOptions opt;
    opt.notch_enabled = false;
    const BandPowerSnapshot s = compute_band_powers("TP9", compute_periodogram(x, fs, opt));
    assert(s.label == "TP9");
    assert(approx(relative_sum(s), 1.0, 1e-6));
    assert(s.at(Band::Alpha).relative > 0.95);
    assert(s.total > 0.0);
  }

  // All-zero spectrum: everything zero, no NaN.
  {
    Periodogram p;
    for (int i = 0; i <= 200; ++i) {
      p.freqs_hz.push_back(0.25 * i);
      p.psd.push_back(0.0);
    }
    const BandPowerSnapshot s = compute_band_powers("AF7", p);
    assert(s.total == 0.0);
    for (const auto& b : s.bands) {
      assert(b.absolute == 0.0);
      assert(b.relative == 0.0);
      assert(std::isfinite(b.relative));
    }
  }

  // Aggregates sum absolutes and renormalize.
  {
    const std::vector<BandPowerSnapshot> ch = {snapshot("TP9", 1, 2, 3, 4, 0),
                                               snapshot("TP10", 3, 2, 1, 0, 4)};
    BandPowerSnapshot agg;
    assert(aggregate_band_powers({"PAIR_TP9_10", {"TP9", "TP10"}}, ch, &agg));
    assert(agg.label == "PAIR_TP9_10");
    assert(approx(agg.at(Band::Delta).absolute, 4.0));
    assert(approx(agg.at(Band::Gamma).absolute, 4.0));
    assert(approx(agg.total, 20.0));
    assert(approx(agg.at(Band::Theta).relative, 0.2));
    assert(approx(relative_sum(agg), 1.0, 1e-6));

    BandPowerSnapshot untouched;
    untouched.label = "keep";
    assert(!aggregate_band_powers({"PAIR_AF7_8", {"AF7", "AF8"}}, ch, &untouched));
    assert(untouched.label == "keep");
  }

  // Default aggregates for a headband.
  {
    const auto defs = default_aggregates({"TP9", "AF7", "AF8", "TP10", "AUXL", "AUXR"});
    assert(defs.size() == 5);
    assert(defs[0].label == "ALL" && defs[0].members.size() == 4);
    assert(!has_member(defs[0], "AUXL"));
    assert(defs[3].label == "LEFT" && has_member(defs[3], "TP9") && has_member(defs[3], "AF7"));
    assert(defs[3].members.size() == 2);
    assert(defs[4].label == "RIGHT" && has_member(defs[4], "AF8") && has_member(defs[4], "TP10"));
  }

  // History eviction and smoothing.
  {
    BandHistory h(10.0, 2.0);
    for (TimestampMs t = 0; t <= 15000; t += 1000) {
      assert(h.append(t, static_cast<double>(t) / 1000.0));
    }
    assert(h.points().front().t >= 15000 - 10000);
    assert(h.points().front().t == 5000);
    assert(h.size() == 11);
    // mean of 13, 14, 15
    assert(approx(h.smoothed(), 14.0));

    assert(!h.append(14000, 100.0));
    assert(h.points().back().t == 15000);

    h.clear();
    assert(h.empty());
  }

  // Aggregator: change detection, history, disappearing labels.
  {
    BandPowerOptions opt;
    opt.history_window_sec = 60.0;
    opt.smoothing_window_sec = 10.0;
    BandPowerAggregator agg(opt);

    const std::vector<BandPowerSnapshot> a = {snapshot("TP9", 1, 1, 4, 1, 1), snapshot("TP10", 1, 1, 2, 1, 1)};
    assert(agg.update(a, 1000));
    assert(find(agg.snapshots(), "ALL"));
    assert(find(agg.snapshots(), "PAIR_TP9_10"));
    assert(!find(agg.snapshots(), "PAIR_AF7_8"));
    const BandHistory* h = agg.history("TP9", Band::Alpha);
    assert(h && h->size() == 1);
    assert(approx(h->points().back().v, 0.5));

    // Identical values: no history append.
    assert(!agg.update(a, 2000));
    assert(agg.history("TP9", Band::Alpha)->size() == 1);

    const std::vector<BandPowerSnapshot> b = {snapshot("TP9", 1, 1, 6, 1, 1)};
    assert(agg.update(b, 3000));
    assert(agg.history("TP9", Band::Alpha)->size() == 2);
    assert(agg.history("TP10", Band::Alpha) == nullptr);
    assert(!find(agg.snapshots(), "TP10"));

    agg.clear();
    assert(agg.snapshots().empty());
    assert(agg.history_labels().empty());
  }

  {
    BandPowerOptions bad;
    bad.history_window_sec = 0.0;
    bool threw = false;
    try {
      BandPowerAggregator agg(bad);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_bandpower OK\n";
  return 0;
}
