#pragma once

#include "paschen/folder_aggregator.hpp"
#include "paschen/run_config.hpp"
#include "paschen/svg_plot.hpp"
#include "paschen/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace paschen {

// Per-folder bookkeeping kept alongside the merged rows.
struct FolderOutcome {
  std::string label;
  std::string folder;
  bool skipped{false};     // pressure log could not be loaded
  size_t n_captures{0};    // captures read successfully
  size_t first_row{0};     // index into CombinedResult::rows
  size_t n_rows{0};
};

struct CombinedResult {
  std::vector<SummaryRow> rows;           // folder -> file -> channel order
  std::vector<FolderOutcome> folders;     // same order as RunConfig::folders
  std::vector<ProcessingIssue> issues;
  std::vector<std::string> plots_written;
};

// Thrown by combine_folders() when not a single row was produced. Carries the
// issues collected so far so that callers can still report them.
class NothingToCombineError : public std::runtime_error {
public:
  explicit NothingToCombineError(std::vector<ProcessingIssue> issues)
      : std::runtime_error("no folder produced any results"), issues_(std::move(issues)) {}

  const std::vector<ProcessingIssue>& issues() const { return issues_; }

private:
  std::vector<ProcessingIssue> issues_;
};

// Run process_folder() for every configured folder, in order.
//
// A folder whose pressure log cannot be read is skipped entirely (one
// folder-level issue, zero rows). Rows are appended only after a folder has
// been fully processed.
//
// Throws NothingToCombineError if no folder produced any rows.
CombinedResult combine_folders(const RunConfig& cfg);

// One scatter series per folder that contributed rows: x = scaled pressure,
// y = mean of peaks. Rows without a pressure value are left out.
std::vector<ScatterSeries> build_scatter_series(const CombinedResult& res);

// Write the summary CSV, the scatter SVG, the issue report and the run meta
// JSON. Returns the paths written, in that order.
//
// Throws std::runtime_error if the summary CSV cannot be written. Failures of
// the other artifacts are appended to res->issues as warnings.
std::vector<std::string> write_combined_outputs(CombinedResult* res,
                                                const RunConfig& cfg,
                                                const std::string& config_path = std::string());

} // namespace paschen
