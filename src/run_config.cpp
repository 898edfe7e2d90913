#include "paschen/run_config.hpp"

#include "paschen/utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace paschen {

namespace {

static int find_col(const std::vector<std::string>& header, const std::vector<std::string>& want) {
  for (size_t i = 0; i < header.size(); ++i) {
    const std::string h = to_lower(trim(header[i]));
    for (const auto& w : want) {
      if (h == w) return static_cast<int>(i);
    }
  }
  return -1;
}

static bool parse_bool_token(const std::string& s, bool* out) {
  const std::string t = to_lower(trim(s));
  if (t == "1" || t == "true" || t == "yes" || t == "on") {
    *out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "no" || t == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::string resolve_against(const std::filesystem::path& base, const std::string& p) {
  if (p.empty() || base.empty()) return p;
  const std::filesystem::path q = std::filesystem::u8path(p);
  if (q.is_absolute()) return p;
  return (base / q).lexically_normal().u8string();
}

static std::string cell(const std::vector<std::string>& row, int col) {
  if (col < 0 || static_cast<size_t>(col) >= row.size()) return std::string();
  return trim(row[static_cast<size_t>(col)]);
}

} // namespace

std::string resolve_output_path(const RunConfig& cfg, const std::string& name) {
  if (name.empty()) return name;
  if (std::filesystem::u8path(name).is_absolute()) return name;
  return join_path(cfg.outdir, name);
}

double parse_scale(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) throw std::runtime_error("config: empty scale value");

  const size_t slash = t.find('/');
  if (slash == std::string::npos) return to_double(t);

  const double num = to_double(t.substr(0, slash));
  const double den = to_double(t.substr(slash + 1));
  if (den == 0.0) throw std::runtime_error("config: zero denominator in scale '" + t + "'");
  return num / den;
}

void apply_config_setting(RunConfig* cfg, const std::string& key_in, const std::string& value_in) {
  if (!cfg) return;
  const std::string key = to_lower(trim(key_in));
  const std::string value = trim(value_in);

  if (key == "outdir") {
    cfg->outdir = value;
  } else if (key == "output") {
    cfg->output_csv = value;
  } else if (key == "scatter") {
    cfg->scatter_svg = value;
  } else if (key == "issues") {
    cfg->issues_csv = value;
  } else if (key == "run_meta") {
    cfg->run_meta_json = value;
  } else if (key == "capture_prefix") {
    cfg->folder_options.capture_prefix = value;
  } else if (key == "capture_extension") {
    cfg->folder_options.capture_extension = value;
  } else if (key == "plot_dir") {
    cfg->folder_options.plot_dir = value;
  } else if (key == "waveform_plots") {
    bool b = true;
    if (!parse_bool_token(value, &b)) {
      throw std::runtime_error("config: invalid boolean for waveform_plots: '" + value + "'");
    }
    cfg->folder_options.waveform_plots = b;
  } else {
    throw std::runtime_error("config: unknown setting '" + key + "'");
  }
}

RunConfig load_run_config(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("config: failed to open: " + path);

  const std::filesystem::path base = std::filesystem::u8path(path).parent_path();

  RunConfig cfg;
  bool outdir_set = false;
  bool have_header = false;
  int col_folder = -1;
  int col_pressure = -1;
  int col_amp = -1;
  int col_pscale = -1;
  int col_label = -1;

  std::string line;
  size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    if (line_no == 1) line = strip_utf8_bom(line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string t = trim(line);
    if (t.empty()) continue;

    if (t[0] == '#') {
      const std::string body = trim(t.substr(1));
      const size_t eq = body.find('=');
      if (eq == std::string::npos) continue;
      const std::string key = to_lower(trim(body.substr(0, eq)));
      apply_config_setting(&cfg, key, body.substr(eq + 1));
      if (key == "outdir") outdir_set = true;
      continue;
    }

    const std::vector<std::string> row = split_csv_row(t, ',');
    if (!have_header) {
      col_folder = find_col(row, {"folder", "folder_path"});
      col_pressure = find_col(row, {"pressure_log", "pressure", "pressure_file"});
      col_amp = find_col(row, {"amplitude_scale", "amp_scale", "max_multiplier"});
      col_pscale = find_col(row, {"pressure_scale", "pressure_multiplier"});
      col_label = find_col(row, {"label", "name"});
      if (col_folder < 0) throw std::runtime_error("config: missing required column: folder");
      if (col_pressure < 0) throw std::runtime_error("config: missing required column: pressure_log");
      have_header = true;
      continue;
    }

    FolderJob job;
    job.folder = cell(row, col_folder);
    job.pressure_log = cell(row, col_pressure);
    if (job.folder.empty() || job.pressure_log.empty()) {
      std::ostringstream oss;
      oss << "config: line " << line_no << ": folder and pressure_log are required";
      throw std::runtime_error(oss.str());
    }
    job.folder = resolve_against(base, job.folder);
    job.pressure_log = resolve_against(base, job.pressure_log);

    const std::string amp = cell(row, col_amp);
    const std::string psc = cell(row, col_pscale);
    if (!amp.empty()) job.calibration.amplitude_scale = parse_scale(amp);
    if (!psc.empty()) job.calibration.pressure_scale = parse_scale(psc);
    job.label = cell(row, col_label);
    cfg.folders.push_back(job);
  }

  if (!have_header) throw std::runtime_error("config: missing header row: " + path);

  if (outdir_set) cfg.outdir = resolve_against(base, cfg.outdir);
  cfg.folder_options.plot_dir = resolve_against(base, cfg.folder_options.plot_dir);
  return cfg;
}

} // namespace paschen
