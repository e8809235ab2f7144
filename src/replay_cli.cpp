#include "biostream/bmp_writer.hpp"
#include "biostream/config.hpp"
#include "biostream/processing_core.hpp"
#include "biostream/sample_csv.hpp"
#include "biostream/utils.hpp"
#include "biostream/version.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace biostream;

struct Args {
  std::string eeg_csv;
  std::string ppg_csv;
  double demo_sec{0.0};  // > 0 => synthetic stream

  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;  // --set key=value

  std::string outdir{"out"};
  size_t packet{12};  // EEG samples per packet
  bool verbose{false};
};

static void print_help() {
  std::cout
    << "biostream_replay_cli (replay recorded or synthetic samples through the processing core)\n\n"
    << "Usage:\n"
    << "  biostream_replay_cli --eeg-csv eeg.csv --ppg-csv ppg.csv --outdir out\n"
    << "  biostream_replay_cli --demo 60 --outdir out_demo\n\n"
    << "Options:\n"
    << "  --eeg-csv PATH          EEG samples (header = channel labels, one row per sample)\n"
    << "  --ppg-csv PATH          PPG samples (header = labels in channel order: ambient, IR, red)\n"
    << "  --demo SECONDS          Synthetic stream: 10 Hz alpha EEG and 72 bpm PPG\n"
    << "  --config PATH           key=value configuration file\n"
    << "  --set KEY=VALUE         Override one configuration key (repeatable)\n"
    << "  --outdir DIR            Output directory (default: out)\n"
    << "  --packet N              EEG samples per packet (default: 12)\n"
    << "  --verbose               Print per-tick vitals and band summaries\n"
    << "  --version               Print version and exit\n"
    << "  -h, --help              Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "biostream_replay_cli " << version_string() << " (" << build_type_string()
                << ", " << compiler_string() << ")\n";
      std::exit(0);
    } else if (arg == "--eeg-csv" && i + 1 < argc) {
      a.eeg_csv = argv[++i];
    } else if (arg == "--ppg-csv" && i + 1 < argc) {
      a.ppg_csv = argv[++i];
    } else if (arg == "--demo" && i + 1 < argc) {
      a.demo_sec = to_double(argv[++i]);
    } else if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--set" && i + 1 < argc) {
      const std::string kv = argv[++i];
      const size_t eq = kv.find('=');
      if (eq == std::string::npos) throw std::runtime_error("--set expects KEY=VALUE, got: " + kv);
      a.overrides.emplace_back(trim(kv.substr(0, eq)), trim(kv.substr(eq + 1)));
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--packet" && i + 1 < argc) {
      const int n = to_int(argv[++i]);
      if (n <= 0) throw std::runtime_error("--packet must be > 0");
      a.packet = static_cast<size_t>(n);
    } else if (arg == "--verbose") {
      a.verbose = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static SampleTable demo_eeg(double seconds, double fs) {
  const double two_pi = 2.0 * 3.14159265358979323846;
  const size_t n = static_cast<size_t>(std::llround(seconds * fs));

  SampleTable t;
  t.labels = default_headband_labels();
  t.labels.resize(4);  // TP9, AF7, AF8, TP10
  t.columns.assign(t.labels.size(), std::vector<double>(n, 0.0));

  std::mt19937 rng(12345);
  std::normal_distribution<double> noise(0.0, 2.0);
  for (size_t c = 0; c < t.columns.size(); ++c) {
    const double phase = 0.4 * static_cast<double>(c);
    for (size_t i = 0; i < n; ++i) {
      const double tt = static_cast<double>(i) / fs;
      t.columns[c][i] = 20.0 * std::sin(two_pi * 10.0 * tt + phase) +
                        5.0 * std::sin(two_pi * 6.0 * tt) + noise(rng);
    }
  }
  return t;
}

static SampleTable demo_ppg(double seconds, double fs) {
  const double two_pi = 2.0 * 3.14159265358979323846;
  const double pulse_hz = 1.2;  // 72 bpm
  const size_t n = static_cast<size_t>(std::llround(seconds * fs));

  SampleTable t;
  t.labels = {"AMBIENT", "IR", "RED"};
  t.columns.assign(3, std::vector<double>(n, 0.0));

  std::mt19937 rng(6789);
  std::normal_distribution<double> noise(0.0, 5.0);
  for (size_t i = 0; i < n; ++i) {
    const double s = std::sin(two_pi * pulse_hz * static_cast<double>(i) / fs);
    t.columns[0][i] = 1000.0 + noise(rng);
    t.columns[1][i] = 40000.0 + 800.0 * s + noise(rng);
    t.columns[2][i] = 20000.0 + 240.0 * s + noise(rng);
  }
  return t;
}

static std::string opt_str(const std::optional<double>& v) {
  if (!v) return "";
  std::ostringstream oss;
  oss << *v;
  return oss.str();
}

static std::string opt_str(const std::optional<int>& v) {
  return v ? std::to_string(*v) : std::string();
}

static void append_slice(const SampleTable& table,
                         size_t begin,
                         size_t end,
                         std::vector<std::vector<double>>* chunks) {
  chunks->assign(table.columns.size(), std::vector<double>());
  for (size_t c = 0; c < table.columns.size(); ++c) {
    const auto& col = table.columns[c];
    const size_t b = std::min(begin, col.size());
    const size_t e = std::min(end, col.size());
    (*chunks)[c].assign(col.begin() + static_cast<std::ptrdiff_t>(b),
                        col.begin() + static_cast<std::ptrdiff_t>(e));
  }
}

int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);
    if (args.eeg_csv.empty() && args.ppg_csv.empty() && args.demo_sec <= 0.0) {
      print_help();
      throw std::runtime_error("one of --eeg-csv, --ppg-csv or --demo is required");
    }
    for (const std::string* p : {&args.eeg_csv, &args.ppg_csv, &args.config_path}) {
      if (!p->empty() && !file_exists(*p)) throw std::runtime_error("Input file not found: " + *p);
    }

    PipelineConfig cfg;
    if (!args.config_path.empty()) {
      cfg = load_pipeline_config(args.config_path, cfg);
      std::cout << "Loaded config: " << args.config_path << "\n";
    }
    for (const auto& kv : args.overrides) apply_config_value(&cfg, kv.first, kv.second);

    SampleTable eeg;
    SampleTable ppg;
    if (args.demo_sec > 0.0) {
      eeg = demo_eeg(args.demo_sec, cfg.eeg_fs_hz);
      ppg = demo_ppg(args.demo_sec, cfg.ppg_fs_hz);
      std::cout << "Generated demo stream: " << args.demo_sec << " s\n";
    }
    if (!args.eeg_csv.empty()) {
      eeg = read_sample_csv(args.eeg_csv);
      std::cout << "Loaded EEG: " << args.eeg_csv << " (" << eeg.n_channels() << " channels, "
                << eeg.n_rows() << " samples)\n";
    }
    if (!args.ppg_csv.empty()) {
      ppg = read_sample_csv(args.ppg_csv);
      if (ppg.n_channels() > 3) {
        std::cerr << "Warning: only the first 3 PPG columns are used\n";
      }
      std::cout << "Loaded PPG: " << args.ppg_csv << " (" << ppg.n_channels() << " channels, "
                << ppg.n_rows() << " samples)\n";
    }
    if (cfg.channel_labels.empty()) cfg.channel_labels = eeg.labels;

    ProcessingCore core(cfg);

    ensure_directory(args.outdir);
    const std::string band_path = args.outdir + "/bandpower_history.csv";
    const std::string vitals_path = args.outdir + "/vitals.csv";
    const std::string artifacts_path = args.outdir + "/artifacts.csv";

    std::ofstream band_csv(std::filesystem::u8path(band_path));
    std::ofstream vitals_csv(std::filesystem::u8path(vitals_path));
    std::ofstream artifacts_csv(std::filesystem::u8path(artifacts_path));
    if (!band_csv) throw std::runtime_error("Failed to open output CSV: " + band_path);
    if (!vitals_csv) throw std::runtime_error("Failed to open output CSV: " + vitals_path);
    if (!artifacts_csv) throw std::runtime_error("Failed to open output CSV: " + artifacts_path);

    band_csv << "time_ms,label,band,absolute,relative,smoothed\n";
    vitals_csv << "time_ms,heart_rate_bpm,spo2,ratio,perfusion_index_ir,perfusion_index_red,"
                  "ok,reason,pulse_channel,pulse_quality\n";
    artifacts_csv << "time_ms,channel,start_sample,end_sample,amplitude_range,line_noise_ratio,"
                     "amplitude_artifact,line_noise_artifact\n";

    // Simulated clock: one tick per EEG packet (or per equivalent PPG span).
    const double step_sec = static_cast<double>(args.packet) / cfg.eeg_fs_hz;
    const double eeg_sec = static_cast<double>(eeg.n_rows()) / cfg.eeg_fs_hz;
    const double ppg_sec = static_cast<double>(ppg.n_rows()) / cfg.ppg_fs_hz;
    const double total_sec = std::max(eeg_sec, ppg_sec);

    size_t eeg_pos = 0;
    size_t ppg_pos = 0;
    size_t n_ticks = 0;
    TimestampMs now = 0;
    std::vector<std::vector<double>> chunks;

    for (double t = step_sec; t < total_sec + step_sec; t += step_sec) {
      now = static_cast<TimestampMs>(std::llround(t * 1000.0));

      const size_t eeg_end = std::min(eeg.n_rows(), static_cast<size_t>(std::llround(t * cfg.eeg_fs_hz)));
      if (eeg_end > eeg_pos) {
        append_slice(eeg, eeg_pos, eeg_end, &chunks);
        for (size_t c = 0; c < chunks.size(); ++c) {
          core.ingest(EegPacket{static_cast<int>(c), chunks[c]});
        }
        eeg_pos = eeg_end;
      }

      const size_t ppg_end = std::min(ppg.n_rows(), static_cast<size_t>(std::llround(t * cfg.ppg_fs_hz)));
      if (ppg_end > ppg_pos) {
        append_slice(ppg, ppg_pos, ppg_end, &chunks);
        for (size_t c = 0; c < chunks.size() && c < 3; ++c) {
          core.ingest(PpgPacket{static_cast<int>(c), ppg.labels[c], chunks[c]});
        }
        ppg_pos = ppg_end;
      }

      const TickResult r = core.tick(now);
      ++n_ticks;

      if (r.bandpower_changed) {
        std::map<std::pair<std::string, size_t>, double> smoothed;
        for (const auto& s : r.band_history) smoothed[{s.label, band_index(s.band)}] = s.smoothed;

        for (const auto& snap : r.band_snapshots) {
          for (const auto& def : standard_bands()) {
            const size_t b = band_index(def.band);
            const auto it = smoothed.find({snap.label, b});
            band_csv << now << "," << snap.label << "," << def.name << "," << snap.bands[b].absolute
                     << "," << snap.bands[b].relative << ","
                     << (it != smoothed.end() ? it->second : snap.bands[b].relative) << "\n";
          }
        }

        if (args.verbose) {
          for (const auto& snap : r.band_snapshots) {
            if (snap.label != "ALL") continue;
            std::cout << "[" << now << " ms] ALL alpha=" << snap.at(Band::Alpha).relative
                      << " theta=" << snap.at(Band::Theta).relative
                      << " beta=" << snap.at(Band::Beta).relative << "\n";
          }
        }
      }

      if (r.computed) {
        for (const auto& ch : r.eeg) {
          if (!ch.artifacts.latest) continue;
          const ArtifactWindow& w = *ch.artifacts.latest;
          artifacts_csv << now << "," << ch.label << "," << w.start_sample << "," << w.end_sample << ","
                        << w.amplitude_range << "," << w.line_noise_ratio << ","
                        << (w.amplitude_artifact ? 1 : 0) << "," << (w.line_noise_artifact ? 1 : 0) << "\n";
        }
      }

      if (r.vitals_updated && r.vitals) {
        const HeartVitals& v = *r.vitals;
        vitals_csv << now << "," << opt_str(v.heart_rate_bpm) << "," << opt_str(v.spo2) << ","
                   << opt_str(v.ratio) << "," << opt_str(v.perfusion_index_ir) << ","
                   << opt_str(v.perfusion_index_red) << "," << (v.ok ? 1 : 0) << ","
                   << vitals_reason_name(v.reason) << "," << v.pulse_channel_label << ","
                   << opt_str(v.pulse_quality) << "\n";

        if (args.verbose) {
          std::cout << "[" << now << " ms] HR=" << (v.heart_rate_bpm ? std::to_string(*v.heart_rate_bpm) : "-")
                    << " SpO2=" << (v.spo2 ? opt_str(v.spo2) : "-")
                    << " reason=" << vitals_reason_name(v.reason)
                    << " pulse=" << (v.pulse_channel_label.empty() ? "-" : v.pulse_channel_label) << "\n";
        }
      }
    }

    std::cout << "Replayed " << n_ticks << " ticks (" << total_sec << " s)\n";
    std::cout << "Wrote: " << band_path << "\n";
    std::cout << "Wrote: " << vitals_path << "\n";
    std::cout << "Wrote: " << artifacts_path << "\n";

    const SpectrogramImage img = core.build_spectrogram({}, now);
    if (img.width > 0 && img.height > 0) {
      const std::string bmp_path = args.outdir + "/spectrogram.bmp";
      write_bmp24(bmp_path, img.width, img.height, img.pixels);
      std::cout << "Wrote: " << bmp_path << " (" << spectrogram_source_name(img.source)
                << ", " << img.domain.vmin_db << ".." << img.domain.vmax_db << " dB)\n";
    } else {
      std::cerr << "Spectrogram unavailable: not enough EEG samples\n";
    }

    const std::vector<RawTrace> exported = core.export_window();
    if (!exported.empty()) {
      const std::string export_path = args.outdir + "/raw_export.csv";
      std::ofstream f(std::filesystem::u8path(export_path));
      if (!f) throw std::runtime_error("Failed to open output CSV: " + export_path);
      size_t rows = 0;
      for (size_t c = 0; c < exported.size(); ++c) {
        f << (c ? "," : "") << exported[c].label;
        rows = std::max(rows, exported[c].samples.size());
      }
      f << "\n";
      for (size_t i = 0; i < rows; ++i) {
        for (size_t c = 0; c < exported.size(); ++c) {
          if (c) f << ",";
          if (i < exported[c].samples.size()) f << exported[c].samples[i];
        }
        f << "\n";
      }
      std::cout << "Wrote: " << export_path << "\n";
    }

    {
      const std::string cfg_path = args.outdir + "/pipeline_config.txt";
      std::ofstream f(std::filesystem::u8path(cfg_path));
      if (!f) throw std::runtime_error("Failed to write: " + cfg_path);
      f << "# biostream " << version_string() << "\n";
      f << format_pipeline_config(core.config());
      std::cout << "Wrote: " << cfg_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
