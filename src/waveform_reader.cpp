#include "paschen/waveform_reader.hpp"

#include "paschen/utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace paschen {

namespace {

static double parse_sample_cell(const std::vector<std::string>& row, size_t col,
                                size_t line_no, const std::string& column) {
  if (col >= row.size()) {
    std::ostringstream oss;
    oss << "waveform: line " << line_no << ": missing value for column '" << column << "'";
    throw std::runtime_error(oss.str());
  }
  double v = 0.0;
  if (!try_parse_double(row[col], &v) || !std::isfinite(v)) {
    std::ostringstream oss;
    oss << "waveform: line " << line_no << ": invalid number '" << trim(row[col])
        << "' in column '" << column << "'";
    throw std::runtime_error(oss.str());
  }
  return v;
}

} // namespace

WaveformCapture WaveformReader::read(const std::string& path) const {
  std::error_code ec;
  if (std::filesystem::is_directory(std::filesystem::u8path(path), ec)) {
    throw std::runtime_error("waveform: not a file: " + path);
  }
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("waveform: failed to open: " + path);

  std::string line;
  size_t line_no = 0;
  std::vector<std::string> header;
  bool have_header = false;

  while (std::getline(f, line)) {
    ++line_no;
    if (line_no == 1) line = strip_utf8_bom(line);
    if (trim(line).empty()) continue;
    const std::vector<std::string> cols = split_csv_row(line, opt_.delim);
    if (!cols.empty() && starts_with(trim(cols[0]), "Time")) {
      header = cols;
      have_header = true;
      break;
    }
  }
  if (f.bad()) throw std::runtime_error("waveform: read error: " + path);
  if (!have_header) {
    throw std::runtime_error("waveform: no header row starting with 'Time' in: " + path);
  }

  int time_col = -1;
  std::vector<size_t> channel_cols;
  WaveformCapture cap;
  for (size_t i = 0; i < header.size(); ++i) {
    const std::string h = trim(header[i]);
    if (time_col < 0 && h == opt_.time_column) {
      time_col = static_cast<int>(i);
    } else if (starts_with(h, opt_.channel_prefix)) {
      channel_cols.push_back(i);
      WaveformChannel ch;
      ch.name = h;
      cap.channels.push_back(ch);
    }
  }
  if (time_col < 0) {
    throw std::runtime_error("waveform: missing column '" + opt_.time_column + "' in: " + path);
  }
  if (channel_cols.empty()) {
    throw std::runtime_error("waveform: no '" + opt_.channel_prefix + "*' channel columns in: " + path);
  }

  while (std::getline(f, line)) {
    ++line_no;
    if (trim(line).empty()) continue;
    const std::vector<std::string> row = split_csv_row(line, opt_.delim);

    const double t = parse_sample_cell(row, static_cast<size_t>(time_col), line_no, opt_.time_column);
    if (!cap.time_ms.empty() && t < cap.time_ms.back()) {
      std::ostringstream oss;
      oss << "waveform: line " << line_no << ": time goes backwards (" << t << " after "
          << cap.time_ms.back() << ")";
      throw std::runtime_error(oss.str());
    }
    cap.time_ms.push_back(t);

    for (size_t c = 0; c < channel_cols.size(); ++c) {
      cap.channels[c].values.push_back(
          parse_sample_cell(row, channel_cols[c], line_no, cap.channels[c].name));
    }
  }

  if (f.bad()) throw std::runtime_error("waveform: read error: " + path);

  if (cap.n_samples() < 2) {
    throw std::runtime_error("waveform: fewer than 2 samples in: " + path);
  }
  return cap;
}

} // namespace paschen
