#pragma once

#include "paschen/types.hpp"

#include <string>
#include <utility>

namespace paschen {

struct WaveformReaderOptions {
  // Exact (trimmed) header label of the time axis column, in milliseconds.
  std::string time_column{"Time (ms)"};

  // Every header label starting with this prefix is read as a channel.
  std::string channel_prefix{"CH"};

  // Field delimiter of the export.
  char delim{','};
};

// Reader for oscilloscope CSV exports (Pokit DSO and similar).
//
// The export starts with free-form metadata lines. They are skipped until a row
// whose first field starts with "Time"; that row is the header. All following
// non-blank rows are samples.
//
// The whole file is rejected (std::runtime_error) when:
// - it is a directory, cannot be opened or fails mid-read
// - no header row is found
// - the header lacks the time column or has no channel column
// - a time or channel cell is missing, non-numeric or non-finite
// - the time axis decreases
// - fewer than two samples were read
class WaveformReader {
public:
  WaveformReader() = default;
  explicit WaveformReader(WaveformReaderOptions opt) : opt_(std::move(opt)) {}

  WaveformCapture read(const std::string& path) const;

private:
  WaveformReaderOptions opt_;
};

} // namespace paschen
