#include "paschen/combiner.hpp"

#include "paschen/pressure_reader.hpp"
#include "paschen/run_meta.hpp"
#include "paschen/summary_csv.hpp"
#include "paschen/utils.hpp"

#include <utility>

namespace paschen {

CombinedResult combine_folders(const RunConfig& cfg) {
  CombinedResult out;

  for (const FolderJob& job : cfg.folders) {
    FolderOutcome fo;
    fo.label = folder_label(job);
    fo.folder = job.folder;
    fo.first_row = out.rows.size();

    PressureSeries pressure;
    try {
      pressure = read_pressure_log(job.pressure_log);
    } catch (const std::exception& e) {
      ProcessingIssue is;
      is.level = IssueLevel::Error;
      is.scope = "folder";
      is.path = job.folder;
      is.message = std::string("skipped, pressure log unreadable: ") + e.what();
      out.issues.push_back(is);
      fo.skipped = true;
      out.folders.push_back(fo);
      continue;
    }

    FolderResult fr = process_folder(job, pressure, cfg.folder_options);
    fo.n_captures = fr.n_captures;
    fo.n_rows = fr.rows.size();

    out.rows.insert(out.rows.end(), fr.rows.begin(), fr.rows.end());
    out.issues.insert(out.issues.end(), fr.issues.begin(), fr.issues.end());
    out.plots_written.insert(out.plots_written.end(), fr.plots_written.begin(), fr.plots_written.end());
    out.folders.push_back(fo);
  }

  if (out.rows.empty()) {
    throw NothingToCombineError(std::move(out.issues));
  }
  return out;
}

std::vector<ScatterSeries> build_scatter_series(const CombinedResult& res) {
  std::vector<ScatterSeries> out;
  for (const auto& fo : res.folders) {
    if (fo.n_rows == 0) continue;
    ScatterSeries s;
    s.label = fo.label;
    for (size_t i = fo.first_row; i < fo.first_row + fo.n_rows && i < res.rows.size(); ++i) {
      const SummaryRow& r = res.rows[i];
      if (!r.pressure) continue;
      s.x.push_back(*r.pressure);
      s.y.push_back(r.mean_of_peaks);
    }
    out.push_back(s);
  }
  return out;
}

std::vector<std::string> write_combined_outputs(CombinedResult* res,
                                                const RunConfig& cfg,
                                                const std::string& config_path) {
  std::vector<std::string> written;
  if (!res) return written;

  ensure_directory(cfg.outdir);

  const std::string csv_path = resolve_output_path(cfg, cfg.output_csv);
  write_summary_csv(csv_path, res->rows);
  written.push_back(csv_path);

  auto warn = [&](const std::string& path, const std::string& msg) {
    ProcessingIssue is;
    is.level = IssueLevel::Warning;
    is.scope = "output";
    is.path = path;
    is.message = msg;
    res->issues.push_back(is);
  };

  if (!cfg.scatter_svg.empty()) {
    const std::string svg_path = resolve_output_path(cfg, cfg.scatter_svg);
    ScatterPlotOptions sopt;
    sopt.title = "Voltage vs Pressure * Length";
    sopt.x_label = "Pressure * length (micron * cm)";
    sopt.y_label = "Voltage";
    try {
      write_scatter_svg(svg_path, build_scatter_series(*res), sopt);
      written.push_back(svg_path);
    } catch (const std::exception& e) {
      warn(svg_path, e.what());
    }
  }

  // Written last among the tables so that output warnings above are included.
  if (!cfg.issues_csv.empty()) {
    const std::string issues_path = resolve_output_path(cfg, cfg.issues_csv);
    try {
      write_issues_csv(issues_path, res->issues);
      written.push_back(issues_path);
    } catch (const std::exception& e) {
      warn(issues_path, e.what());
    }
  }

  if (!cfg.run_meta_json.empty()) {
    const std::string meta_path = resolve_output_path(cfg, cfg.run_meta_json);
    std::vector<std::string> outputs = written;
    outputs.insert(outputs.end(), res->plots_written.begin(), res->plots_written.end());
    if (write_run_meta_json(meta_path, "paschen_cli", cfg.outdir, config_path, outputs)) {
      written.push_back(meta_path);
    } else {
      warn(meta_path, "failed to write run meta JSON");
    }
  }

  return written;
}

} // namespace paschen
