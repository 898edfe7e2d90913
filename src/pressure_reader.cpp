#include "paschen/pressure_reader.hpp"

#include "paschen/timestamps.hpp"
#include "paschen/utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace paschen {

namespace {

static bool parse_pressure_row(const std::string& line, PressureSample* out) {
  std::vector<std::string> cols;
  try {
    cols = split_csv_row(line, ',');
  } catch (const std::exception&) {
    return false;
  }
  if (cols.size() < 2) return false;

  PressureSample s;
  if (!parse_pressure_log_timestamp(cols[0], &s.timestamp)) return false;
  if (!try_parse_double(cols[1], &s.pressure) || !std::isfinite(s.pressure)) return false;
  *out = s;
  return true;
}

} // namespace

PressureSeries read_pressure_log(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(std::filesystem::u8path(path), ec)) {
    throw std::runtime_error("pressure: not a file: " + path);
  }
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("pressure: failed to open: " + path);

  PressureSeries out;
  std::string line;
  bool first = true;
  while (std::getline(f, line)) {
    if (first) line = strip_utf8_bom(line);
    if (trim(line).empty()) continue;
    first = false;

    PressureSample s;
    if (parse_pressure_row(line, &s)) out.push_back(s);
  }
  if (f.bad()) throw std::runtime_error("pressure: read error: " + path);
  return out;
}

} // namespace paschen
