#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace paschen {

// Seconds since 1970-01-01T00:00:00 of a zone-less civil date-time.
//
// Capture file names and the pressure gauge log are both wall-clock readings
// taken on the same bench, so they are compared as-is without any time zone.
using CivilSeconds = int64_t;

struct RGB {
  uint8_t r{0}, g{0}, b{0};
};

struct WaveformChannel {
  std::string name;             // e.g. "CH1"
  std::vector<double> values;   // amplitude samples, same length as time_ms
};

// One oscilloscope export: a shared time axis plus one or more channels.
//
// Invariants (enforced by WaveformReader):
// - time_ms is non-decreasing
// - every channel has exactly n_samples() values
struct WaveformCapture {
  std::vector<double> time_ms;
  std::vector<WaveformChannel> channels;

  size_t n_channels() const { return channels.size(); }
  size_t n_samples() const { return time_ms.size(); }
};

struct PressureSample {
  CivilSeconds timestamp{0};
  double pressure{0.0};
};

// Pressure log in file order. Only rows with a parseable timestamp and
// pressure reach this structure.
using PressureSeries = std::vector<PressureSample>;

// Per-folder multipliers that convert raw readings into physical units
// (e.g. divider ratio for the probe, gap length for pressure * distance).
struct Calibration {
  double amplitude_scale{1.0};
  double pressure_scale{1.0};
};

// One output row: statistics for a single (capture file, channel) pair.
//
// stddev_of_peaks is NaN when fewer than two peaks survived; median_slope is
// NaN when the slope could not be computed. pressure is empty when the
// pressure log held no samples.
struct SummaryRow {
  std::string folder;
  std::string file_name;
  std::string channel;
  size_t n_peaks{0};
  double mean_of_peaks{0.0};
  double stddev_of_peaks{0.0};
  double median_slope{0.0};
  std::optional<double> pressure;
};

enum class IssueLevel {
  Warning,
  Error,
};

// A recoverable problem encountered while processing one unit of work.
// scope is one of "folder", "file", "channel" or "output".
struct ProcessingIssue {
  IssueLevel level{IssueLevel::Error};
  std::string scope;
  std::string path;
  std::string message;
};

inline const char* issue_level_name(IssueLevel level) {
  return (level == IssueLevel::Warning) ? "warning" : "error";
}

} // namespace paschen
