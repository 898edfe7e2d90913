#pragma once

#include "paschen/folder_aggregator.hpp"

#include <string>
#include <vector>

namespace paschen {

// Everything a batch run needs. Built from a config table and/or CLI flags and
// passed explicitly to combine_folders().
struct RunConfig {
  std::vector<FolderJob> folders;
  FolderOptions folder_options;

  // Output directory. Relative output names below are placed inside it;
  // absolute ones are used as-is.
  std::string outdir{"out"};
  std::string output_csv{"combined_summary_results.csv"};
  std::string scatter_svg{"paschen_scatter.svg"};
  std::string issues_csv{"issues.csv"};
  std::string run_meta_json{"paschen_run_meta.json"};
};

// Resolve one of the RunConfig output names against cfg.outdir.
std::string resolve_output_path(const RunConfig& cfg, const std::string& name);

// Parse a calibration multiplier. Accepts a plain number or a ratio "a/b"
// (e.g. "10.48/0.105" for a probe divider). Throws std::runtime_error for
// malformed input or a zero denominator.
double parse_scale(const std::string& s);

// Load a run configuration table.
//
// Format (comma-separated, '#' comment lines allowed):
//
//   # outdir=results
//   # output=combined_summary_results.csv
//   # capture_prefix=Pokit DSO Export
//   folder,pressure_log,amplitude_scale,pressure_scale,label
//   run1,run1_pressure.csv,10.48/0.105,38.8,Magnets
//
// Required columns: folder, pressure_log. Optional: amplitude_scale,
// pressure_scale (default 1), label. Column names are matched
// case-insensitively; "pressure", "max_multiplier" and "pressure_multiplier"
// are accepted as aliases.
//
// Recognized "# key=value" keys: outdir, output, scatter, issues, run_meta,
// capture_prefix, capture_extension, plot_dir, waveform_plots. Comment lines
// without '=' are ignored; an unknown key is an error.
//
// Relative folder, pressure_log, outdir and plot_dir values are resolved
// against the directory containing the config file.
//
// Throws std::runtime_error on unreadable files or malformed content.
RunConfig load_run_config(const std::string& path);

// Apply one "key=value" setting (as used in config metadata lines).
// Throws std::runtime_error for unknown keys or invalid values.
void apply_config_setting(RunConfig* cfg, const std::string& key, const std::string& value);

} // namespace paschen
