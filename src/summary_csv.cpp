#include "paschen/summary_csv.hpp"

#include "paschen/utils.hpp"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace paschen {

std::string csv_escape(const std::string& s) {
  bool need = false;
  for (char c : s) {
    if (c == '"' || c == ',' || c == '\n' || c == '\r') {
      need = true;
      break;
    }
  }
  if (!need) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_csv_number(double v) {
  if (!std::isfinite(v)) return std::string();
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(12) << v;
  return oss.str();
}

std::string format_csv_number(const std::optional<double>& v) {
  if (!v) return std::string();
  return format_csv_number(*v);
}

const std::vector<std::string>& summary_csv_columns() {
  static const std::vector<std::string> cols = {
    "File Name",
    "Channel",
    "Mean of Maxes",
    "Standard Deviation of Maxes",
    "Median Slope",
    "Pressure (micron)",
  };
  return cols;
}

void write_summary_csv(const std::string& path, const std::vector<SummaryRow>& rows) {
  std::ostringstream o;
  const auto& cols = summary_csv_columns();
  for (size_t i = 0; i < cols.size(); ++i) {
    if (i) o << ",";
    o << csv_escape(cols[i]);
  }
  o << "\n";

  for (const auto& r : rows) {
    o << csv_escape(r.file_name) << ","
      << csv_escape(r.channel) << ","
      << format_csv_number(r.mean_of_peaks) << ","
      << format_csv_number(r.stddev_of_peaks) << ","
      << format_csv_number(r.median_slope) << ","
      << format_csv_number(r.pressure) << "\n";
  }

  if (!write_text_file_atomic(path, o.str())) {
    throw std::runtime_error("Failed to write summary CSV: " + path);
  }
}

void write_issues_csv(const std::string& path, const std::vector<ProcessingIssue>& issues) {
  std::ostringstream o;
  o << "level,scope,path,message\n";
  for (const auto& is : issues) {
    o << issue_level_name(is.level) << ","
      << csv_escape(is.scope) << ","
      << csv_escape(is.path) << ","
      << csv_escape(is.message) << "\n";
  }
  if (!write_text_file_atomic(path, o.str())) {
    throw std::runtime_error("Failed to write issues CSV: " + path);
  }
}

} // namespace paschen
