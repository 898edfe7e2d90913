#pragma once

#include "paschen/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace paschen {

// CSV helpers for the combined summary table and the per-run issue report.
//
// Notes:
// - Comma-delimited, numbers written in the classic "C" locale.
// - Undefined values (NaN, absent pressure) are written as empty cells.

// Escape a string for inclusion in a CSV cell.
// The cell is quoted if it contains a comma, quote or newline.
std::string csv_escape(const std::string& s);

// Format a number for a CSV cell with up to 12 significant digits.
// NaN/inf and empty optionals yield an empty string.
std::string format_csv_number(double v);
std::string format_csv_number(const std::optional<double>& v);

// Column headers of the combined summary table, in order.
const std::vector<std::string>& summary_csv_columns();

// Columns:
//   File Name,Channel,Mean of Maxes,Standard Deviation of Maxes,Median Slope,Pressure (micron)
//
// Throws std::runtime_error if the file cannot be written.
void write_summary_csv(const std::string& path, const std::vector<SummaryRow>& rows);

// Columns: level,scope,path,message
void write_issues_csv(const std::string& path, const std::vector<ProcessingIssue>& issues);

} // namespace paschen
