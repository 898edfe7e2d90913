#include "paschen/folder_aggregator.hpp"

#include "paschen/running_stats.hpp"
#include "paschen/slope.hpp"
#include "paschen/svg_plot.hpp"
#include "paschen/timestamp_align.hpp"
#include "paschen/timestamps.hpp"
#include "paschen/utils.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace paschen {

namespace {

static ProcessingIssue make_issue(IssueLevel level, const std::string& scope,
                                  const std::string& path, const std::string& message) {
  ProcessingIssue is;
  is.level = level;
  is.scope = scope;
  is.path = path;
  is.message = message;
  return is;
}

// Channel labels like "CH1 (V)" end up in file names.
static std::string filename_safe(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    switch (c) {
      case '/': case '\\': case ':': case '*': case '?':
      case '"': case '<': case '>': case '|':
        c = '_';
        break;
      default:
        break;
    }
  }
  return out;
}

} // namespace

std::string waveform_plot_path(const std::string& capture_path,
                               const std::string& channel,
                               const std::string& plot_dir) {
  const std::filesystem::path p = std::filesystem::u8path(capture_path);
  const std::string name = p.stem().u8string() + "_" + filename_safe(channel) + ".svg";
  if (!plot_dir.empty()) return join_path(plot_dir, name);
  return (p.parent_path() / std::filesystem::u8path(name)).u8string();
}

std::string folder_label(const FolderJob& job) {
  if (!job.label.empty()) return job.label;
  std::filesystem::path p = std::filesystem::u8path(job.folder);
  if (!p.has_filename()) p = p.parent_path();
  const std::string name = p.filename().u8string();
  return name.empty() ? job.folder : name;
}

std::vector<std::string> list_capture_files(const std::string& folder, const FolderOptions& opt) {
  std::error_code ec;
  std::filesystem::directory_iterator it(std::filesystem::u8path(folder), ec);
  if (ec) {
    throw std::runtime_error("folder: cannot list '" + folder + "': " + ec.message());
  }

  std::vector<std::string> out;
  for (const auto& entry : it) {
    std::error_code fec;
    if (!entry.is_regular_file(fec)) continue;
    const std::string name = entry.path().filename().u8string();
    if (!ends_with(name, opt.capture_extension)) continue;
    if (name.find(opt.capture_prefix) == std::string::npos) continue;
    out.push_back(entry.path().u8string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool summarize_channel(const WaveformCapture& cap,
                       const WaveformChannel& channel,
                       const std::optional<double>& raw_pressure,
                       const Calibration& cal,
                       const PeakExtractorOptions& peak_opt,
                       SummaryRow* out,
                       std::string* slope_error) {
  if (!out) return false;

  std::vector<double> peaks = extract_peaks(channel.values, peak_opt);
  if (peaks.empty()) return false;
  for (double& p : peaks) p *= cal.amplitude_scale;

  const RunningStats st(peaks);

  SummaryRow row;
  row.channel = channel.name;
  row.n_peaks = peaks.size();
  row.mean_of_peaks = st.mean();
  row.stddev_of_peaks = st.stddev_sample();
  row.median_slope = std::numeric_limits<double>::quiet_NaN();
  try {
    row.median_slope = median_slope(cap.time_ms, channel.values);
  } catch (const std::exception& e) {
    if (slope_error) *slope_error = e.what();
  }
  if (raw_pressure) row.pressure = *raw_pressure * cal.pressure_scale;

  *out = row;
  return true;
}

FolderResult process_folder(const FolderJob& job,
                            const PressureSeries& pressure,
                            const FolderOptions& opt) {
  FolderResult res;
  const std::string label = folder_label(job);

  std::vector<std::string> files;
  try {
    files = list_capture_files(job.folder, opt);
  } catch (const std::exception& e) {
    res.issues.push_back(make_issue(IssueLevel::Error, "folder", job.folder, e.what()));
    return res;
  }

  for (const std::string& path : files) {
    const std::string file_name = std::filesystem::u8path(path).filename().u8string();

    CivilSeconds capture_time = 0;
    if (!parse_capture_timestamp(file_name, &capture_time)) {
      res.issues.push_back(make_issue(IssueLevel::Error, "file", path,
                                      "cannot parse capture time from file name"));
      continue;
    }

    WaveformCapture cap;
    try {
      cap = WaveformReader(opt.reader).read(path);
    } catch (const std::exception& e) {
      res.issues.push_back(make_issue(IssueLevel::Error, "file", path, e.what()));
      continue;
    }
    ++res.n_captures;

    const std::optional<double> raw_pressure = nearest_pressure(pressure, capture_time);

    for (const auto& ch : cap.channels) {
      if (opt.waveform_plots) {
        const std::string plot_path = waveform_plot_path(path, ch.name, opt.plot_dir);
        LinePlotOptions lopt;
        lopt.title = ch.name + " vs Time (ms) for " + file_name;
        lopt.x_label = opt.reader.time_column;
        lopt.y_label = ch.name;
        lopt.series_label = ch.name;
        try {
          write_line_plot_svg(plot_path, cap.time_ms, ch.values, lopt);
          res.plots_written.push_back(plot_path);
        } catch (const std::exception& e) {
          res.issues.push_back(make_issue(IssueLevel::Warning, "channel", path + "#" + ch.name, e.what()));
        }
      }

      SummaryRow row;
      std::string slope_error;
      if (!summarize_channel(cap, ch, raw_pressure, job.calibration, opt.peaks, &row, &slope_error)) {
        continue;
      }
      if (!slope_error.empty()) {
        res.issues.push_back(make_issue(IssueLevel::Warning, "channel", path + "#" + ch.name, slope_error));
      }
      row.folder = label;
      row.file_name = file_name;
      res.rows.push_back(row);
    }
  }
  return res;
}

} // namespace paschen
