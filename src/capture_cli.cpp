#include "paschen/folder_aggregator.hpp"
#include "paschen/peak_extractor.hpp"
#include "paschen/pressure_reader.hpp"
#include "paschen/run_config.hpp"
#include "paschen/run_meta.hpp"
#include "paschen/summary_csv.hpp"
#include "paschen/svg_plot.hpp"
#include "paschen/timestamp_align.hpp"
#include "paschen/timestamps.hpp"
#include "paschen/utils.hpp"
#include "paschen/version.hpp"
#include "paschen/waveform_reader.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace paschen;

struct Args {
  std::string input_path;
  std::string pressure_path;
  std::string channel;   // empty => all channels
  std::string outdir;    // empty => no plots
  Calibration calibration;
  PeakExtractorOptions peaks;
  bool show_candidates{true};
};

static void print_help() {
  std::cout
    << "paschen_capture_cli (inspect peak extraction on a single waveform capture)\n\n"
    << "Usage:\n"
    << "  paschen_capture_cli --input \"Pokit DSO Export 2024-03-01-10-06-00.csv\"\n"
    << "  paschen_capture_cli --input capture.csv --pressure pressure.csv --amp-scale 10.48/0.105 --outdir out\n\n"
    << "Options:\n"
    << "  --input PATH            Waveform capture CSV (required)\n"
    << "  --pressure PATH         Pressure log; report the reading nearest to the capture time\n"
    << "  --channel NAME          Only analyse this channel (default: all)\n"
    << "  --amp-scale X           Amplitude multiplier (number or a/b; default: 1)\n"
    << "  --pressure-scale X      Pressure multiplier (number or a/b; default: 1)\n"
    << "  --hysteresis X          Decay factor that confirms a peak (default: 4)\n"
    << "  --trim-sigma X          Outlier trim width in standard deviations (default: 2)\n"
    << "  --fallback-spread X     Trim spread used with fewer than two peaks (default: 10)\n"
    << "  --outdir DIR            Write one waveform SVG per channel plus a row CSV to DIR\n"
    << "  --no-candidates         Do not list raw peak candidates\n"
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
      std::cout << "paschen_capture_cli " << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--pressure" && i + 1 < argc) {
      a.pressure_path = argv[++i];
    } else if (arg == "--channel" && i + 1 < argc) {
      a.channel = argv[++i];
    } else if (arg == "--amp-scale" && i + 1 < argc) {
      a.calibration.amplitude_scale = parse_scale(argv[++i]);
    } else if (arg == "--pressure-scale" && i + 1 < argc) {
      a.calibration.pressure_scale = parse_scale(argv[++i]);
    } else if (arg == "--hysteresis" && i + 1 < argc) {
      a.peaks.hysteresis_factor = to_double(argv[++i]);
    } else if (arg == "--trim-sigma" && i + 1 < argc) {
      a.peaks.trim_sigma = to_double(argv[++i]);
    } else if (arg == "--fallback-spread" && i + 1 < argc) {
      a.peaks.fallback_spread = to_double(argv[++i]);
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--no-candidates") {
      a.show_candidates = false;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static void print_values(const std::string& label, const std::vector<double>& v) {
  std::cout << "  " << label << " (" << v.size() << "):";
  for (double x : v) std::cout << " " << format_csv_number(x);
  std::cout << "\n";
}

int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);
    if (args.input_path.empty()) {
      print_help();
      throw std::runtime_error("--input is required");
    }
    if (!(args.peaks.hysteresis_factor > 0.0)) throw std::runtime_error("--hysteresis must be > 0");
    if (args.peaks.trim_sigma < 0.0) throw std::runtime_error("--trim-sigma must be >= 0");

    const std::string file_name = std::filesystem::u8path(args.input_path).filename().u8string();
    const WaveformCapture cap = WaveformReader().read(args.input_path);

    std::cout << "Capture: " << file_name << "\n";
    std::cout << "Samples: " << cap.n_samples() << ", channels: " << cap.n_channels() << "\n";

    std::optional<double> raw_pressure;
    CivilSeconds capture_time = 0;
    const bool have_time = parse_capture_timestamp(file_name, &capture_time);
    if (have_time) {
      std::cout << "Capture time: " << format_civil_seconds(capture_time) << "\n";
    } else {
      std::cerr << "Warning: cannot parse capture time from file name\n";
    }

    if (!args.pressure_path.empty()) {
      const PressureSeries pressure = read_pressure_log(args.pressure_path);
      std::cout << "Pressure samples: " << pressure.size() << "\n";
      if (have_time) {
        const std::optional<size_t> idx = nearest_pressure_index(pressure, capture_time);
        if (idx) {
          const PressureSample& s = pressure[*idx];
          raw_pressure = s.pressure;
          std::cout << "Nearest pressure: " << format_csv_number(s.pressure) << " at "
                    << format_civil_seconds(s.timestamp) << " (row " << *idx << ")\n";
        } else {
          std::cerr << "Warning: pressure log holds no readable samples\n";
        }
      }
    }

    if (!args.outdir.empty()) ensure_directory(args.outdir);

    std::vector<SummaryRow> rows;
    std::vector<std::string> written;
    bool matched = false;
    for (const auto& ch : cap.channels) {
      if (!args.channel.empty() && to_lower(ch.name) != to_lower(args.channel)) continue;
      matched = true;

      std::cout << "\n" << ch.name << "\n";
      if (args.show_candidates) {
        print_values("candidates", detect_peak_candidates(ch.values, args.peaks));
      }
      print_values("peaks", extract_peaks(ch.values, args.peaks));

      SummaryRow row;
      std::string slope_error;
      if (summarize_channel(cap, ch, raw_pressure, args.calibration, args.peaks, &row, &slope_error)) {
        row.file_name = file_name;
        std::cout << "  mean of peaks: " << format_csv_number(row.mean_of_peaks) << "\n";
        std::cout << "  stddev of peaks: " << format_csv_number(row.stddev_of_peaks) << "\n";
        std::cout << "  median slope: " << format_csv_number(row.median_slope) << "\n";
        std::cout << "  pressure: " << format_csv_number(row.pressure) << "\n";
        if (!slope_error.empty()) std::cerr << "Warning: " << ch.name << ": " << slope_error << "\n";
        rows.push_back(row);
      } else {
        std::cout << "  no peaks survived; channel contributes no row\n";
      }

      if (!args.outdir.empty()) {
        const std::string svg_path = waveform_plot_path(args.input_path, ch.name, args.outdir);
        LinePlotOptions lopt;
        lopt.title = ch.name + " vs Time (ms) for " + file_name;
        lopt.x_label = "Time (ms)";
        lopt.y_label = ch.name;
        lopt.series_label = ch.name;
        write_line_plot_svg(svg_path, cap.time_ms, ch.values, lopt);
        written.push_back(svg_path);
        std::cout << "Wrote: " << svg_path << "\n";
      }
    }

    if (!matched) {
      throw std::runtime_error("channel not found: " + args.channel);
    }

    if (!args.outdir.empty()) {
      const std::string csv_path = join_path(args.outdir, "capture_summary.csv");
      write_summary_csv(csv_path, rows);
      written.push_back(csv_path);
      std::cout << "Wrote: " << csv_path << "\n";

      const std::string meta_path = join_path(args.outdir, "capture_run_meta.json");
      if (write_run_meta_json(meta_path, "paschen_capture_cli", args.outdir, args.input_path, written)) {
        std::cout << "Wrote: " << meta_path << "\n";
      } else {
        std::cerr << "Warning: failed to write " << meta_path << "\n";
      }
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
