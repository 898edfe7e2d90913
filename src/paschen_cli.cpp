#include "paschen/combiner.hpp"
#include "paschen/run_config.hpp"
#include "paschen/summary_csv.hpp"
#include "paschen/utils.hpp"
#include "paschen/version.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace paschen;

struct Args {
  std::string config_path;

  // Folders given on the command line. Each --folder starts a new job;
  // --pressure/--amp-scale/--pressure-scale/--label apply to the latest one.
  std::vector<FolderJob> folders;

  // key=value overrides applied on top of the config file (same keys as the
  // config "# key=value" lines).
  std::vector<std::pair<std::string, std::string>> settings;

  bool quiet{false};
};

static void print_help() {
  std::cout
    << "paschen_cli (breakdown voltage vs pressure * gap, combined over folders)\n\n"
    << "Usage:\n"
    << "  paschen_cli --config runs.csv\n"
    << "  paschen_cli --folder run1 --pressure run1/pressure.csv --amp-scale 10.48/0.105 --pressure-scale 38.8 \\\n"
    << "              --folder run2 --pressure run2/pressure.csv --outdir out\n\n"
    << "Config table (CSV):\n"
    << "  # outdir=out\n"
    << "  folder,pressure_log,amplitude_scale,pressure_scale,label\n"
    << "  run1,run1/pressure.csv,10.48/0.105,38.8,Magnets\n\n"
    << "Options:\n"
    << "  --config PATH           Run configuration table (folders + '# key=value' settings)\n"
    << "  --folder DIR            Add an experiment folder (repeatable; starts a new group)\n"
    << "  --pressure PATH         Pressure log for the latest --folder (required per folder)\n"
    << "  --amp-scale X           Amplitude multiplier for the latest --folder (number or a/b; default: 1)\n"
    << "  --pressure-scale X      Pressure multiplier for the latest --folder (number or a/b; default: 1)\n"
    << "  --label NAME            Legend label for the latest --folder (default: folder name)\n"
    << "  --outdir DIR            Output directory (default: out)\n"
    << "  --output NAME           Combined CSV name under outdir (default: combined_summary_results.csv)\n"
    << "  --scatter NAME          Scatter SVG name under outdir (default: paschen_scatter.svg)\n"
    << "  --issues NAME           Issue report CSV name under outdir (default: issues.csv)\n"
    << "  --prefix TEXT           Capture file name prefix (default: Pokit DSO Export)\n"
    << "  --ext EXT               Capture file extension (default: .csv)\n"
    << "  --plot-dir DIR          Write waveform SVGs here instead of next to each capture\n"
    << "  --no-waveform-plots     Do not write per-channel waveform SVGs\n"
    << "  --quiet                 Do not list every waveform plot written\n"
    << "  --version               Print version and exit\n"
    << "  -h, --help              Show this help\n";
}

static FolderJob& last_folder(Args* a, const std::string& flag) {
  if (a->folders.empty()) {
    throw std::runtime_error(flag + " must follow a --folder");
  }
  return a->folders.back();
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "paschen_cli " << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--folder" && i + 1 < argc) {
      FolderJob job;
      job.folder = argv[++i];
      a.folders.push_back(job);
    } else if (arg == "--pressure" && i + 1 < argc) {
      last_folder(&a, arg).pressure_log = argv[++i];
    } else if (arg == "--amp-scale" && i + 1 < argc) {
      last_folder(&a, arg).calibration.amplitude_scale = parse_scale(argv[++i]);
    } else if (arg == "--pressure-scale" && i + 1 < argc) {
      last_folder(&a, arg).calibration.pressure_scale = parse_scale(argv[++i]);
    } else if (arg == "--label" && i + 1 < argc) {
      last_folder(&a, arg).label = argv[++i];
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.settings.emplace_back("outdir", argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      a.settings.emplace_back("output", argv[++i]);
    } else if (arg == "--scatter" && i + 1 < argc) {
      a.settings.emplace_back("scatter", argv[++i]);
    } else if (arg == "--issues" && i + 1 < argc) {
      a.settings.emplace_back("issues", argv[++i]);
    } else if (arg == "--prefix" && i + 1 < argc) {
      a.settings.emplace_back("capture_prefix", argv[++i]);
    } else if (arg == "--ext" && i + 1 < argc) {
      a.settings.emplace_back("capture_extension", argv[++i]);
    } else if (arg == "--plot-dir" && i + 1 < argc) {
      a.settings.emplace_back("plot_dir", argv[++i]);
    } else if (arg == "--no-waveform-plots") {
      a.settings.emplace_back("waveform_plots", "0");
    } else if (arg == "--quiet") {
      a.quiet = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static void print_issues(const std::vector<ProcessingIssue>& issues) {
  for (const auto& is : issues) {
    std::cerr << "Warning: [" << is.scope << "] " << is.path << ": " << is.message << "\n";
  }
}

int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);

    RunConfig cfg;
    if (!args.config_path.empty()) {
      cfg = load_run_config(args.config_path);
    }
    for (const auto& kv : args.settings) {
      apply_config_setting(&cfg, kv.first, kv.second);
    }
    for (const auto& job : args.folders) {
      if (job.pressure_log.empty()) {
        throw std::runtime_error("--pressure is required for folder: " + job.folder);
      }
      cfg.folders.push_back(job);
    }

    if (cfg.folders.empty()) {
      print_help();
      throw std::runtime_error("no folders given (use --config or --folder)");
    }

    std::cout << "Processing " << cfg.folders.size() << " folder(s)\n";

    CombinedResult res;
    try {
      res = combine_folders(cfg);
    } catch (const NothingToCombineError& e) {
      print_issues(e.issues());
      if (!cfg.issues_csv.empty()) {
        ensure_directory(cfg.outdir);
        const std::string issues_path = resolve_output_path(cfg, cfg.issues_csv);
        write_issues_csv(issues_path, e.issues());
        std::cout << "Wrote: " << issues_path << "\n";
      }
      throw;
    }

    for (const auto& fo : res.folders) {
      if (fo.skipped) {
        std::cout << "  " << fo.label << ": skipped\n";
      } else {
        std::cout << "  " << fo.label << ": " << fo.n_captures << " capture(s), "
                  << fo.n_rows << " row(s)\n";
      }
    }

    if (!args.quiet) {
      for (const auto& p : res.plots_written) {
        std::cout << "Wrote: " << p << "\n";
      }
    } else if (!res.plots_written.empty()) {
      std::cout << "Wrote " << res.plots_written.size() << " waveform plot(s)\n";
    }

    const std::vector<std::string> written =
        write_combined_outputs(&res, cfg, args.config_path);
    print_issues(res.issues);
    for (const auto& p : written) {
      std::cout << "Wrote: " << p << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
