#pragma once

#include "paschen/peak_extractor.hpp"
#include "paschen/types.hpp"
#include "paschen/waveform_reader.hpp"

#include <optional>
#include <string>
#include <vector>

namespace paschen {

// One experiment folder: a directory of waveform captures, the pressure log
// recorded alongside it and its calibration.
struct FolderJob {
  std::string folder;
  std::string pressure_log;
  Calibration calibration;

  // Display name used in the scatter legend. Empty => folder file name.
  std::string label;
};

// Display label of a job: job.label, or the last component of job.folder.
std::string folder_label(const FolderJob& job);

struct FolderOptions {
  // Capture files are regular files whose name contains capture_prefix and
  // ends with capture_extension (both case-sensitive).
  std::string capture_prefix{"Pokit DSO Export"};
  std::string capture_extension{".csv"};

  // Write one amplitude-vs-time SVG per (capture, channel).
  bool waveform_plots{true};

  // Directory for waveform plots. Empty => next to the capture file.
  std::string plot_dir;

  WaveformReaderOptions reader;
  PeakExtractorOptions peaks;
};

struct FolderResult {
  std::vector<SummaryRow> rows;
  std::vector<ProcessingIssue> issues;
  std::vector<std::string> plots_written;
  size_t n_captures{0};
};

// Path of the waveform plot for one channel of a capture:
// "<capture stem>_<channel>.svg" inside plot_dir, or next to the capture when
// plot_dir is empty. Characters that are not valid in file names are replaced
// by '_'.
std::string waveform_plot_path(const std::string& capture_path,
                               const std::string& channel,
                               const std::string& plot_dir);

// Capture files of a folder, sorted by file name. Throws std::runtime_error if
// the folder cannot be listed.
std::vector<std::string> list_capture_files(const std::string& folder, const FolderOptions& opt);

// Statistics for one channel of one capture.
//
// Returns false (and leaves *out untouched) when no peaks survive extraction;
// that channel then contributes no row. Peaks are scaled by
// cal.amplitude_scale before mean/stddev; pressure (if any) by
// cal.pressure_scale. A failing slope estimate is reported through
// *slope_error and leaves median_slope as NaN.
bool summarize_channel(const WaveformCapture& cap,
                       const WaveformChannel& channel,
                       const std::optional<double>& raw_pressure,
                       const Calibration& cal,
                       const PeakExtractorOptions& peak_opt,
                       SummaryRow* out,
                       std::string* slope_error = nullptr);

// Process every capture of job.folder against an already-loaded pressure log.
//
// Per-file problems (unparseable capture time, unreadable or malformed
// capture, plot write failure) are recorded in FolderResult::issues and the
// affected file or channel is skipped; this function does not throw for them.
// A folder that cannot be listed yields no rows and one folder-level issue.
FolderResult process_folder(const FolderJob& job,
                            const PressureSeries& pressure,
                            const FolderOptions& opt = {});

} // namespace paschen
