#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace paschen {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Some instrument exporters on Windows emit one in front of the first line.
std::string strip_utf8_bom(std::string s);

// Split a single CSV row into fields.
//
// Supports the common RFC-4180 behaviors:
//  - fields may be quoted with double quotes
//  - delimiters inside quoted fields are preserved
//  - escaped quotes inside quoted fields are written as "" and are unescaped
//
// Rows must be single-line (no multi-line quoted fields). A trailing '\r' left
// by std::getline on CRLF files is ignored.
//
// Throws std::runtime_error on an unterminated quoted field.
std::vector<std::string> split_csv_row(const std::string& row, char delim = ',');

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// Leading/trailing whitespace is trimmed and the remaining text must be a
// complete number. Parsing uses the classic "C" locale so '.' is always the
// decimal separator. Throws std::runtime_error on failure.
double to_double(const std::string& s);

// Non-throwing variant of to_double(). Returns false for empty or malformed
// input and leaves *out untouched.
bool try_parse_double(const std::string& s, double* out);

bool file_exists(const std::string& path);
void ensure_directory(const std::string& path);

// Join a directory and a file name using std::filesystem semantics.
// Returns `name` unchanged when `dir` is empty.
std::string join_path(const std::string& dir, const std::string& name);

// Write to a temporary file in the destination directory and rename it into
// place, so readers never observe a half-written artifact. Parent directories
// are created. Returns true on success, false on failure.
bool write_text_file_atomic(const std::string& path, const std::string& content);

// Random hexadecimal token (2*n_bytes characters) from std::random_device.
std::string random_hex_token(size_t n_bytes = 8);

// ISO-8601 timestamps of "now", e.g. 2026-01-15T13:37:42-05:00 (local) and
// 2026-01-15T18:37:42Z (UTC). Used for run metadata.
std::string now_string_local();
std::string now_string_utc();

// Escape a string for inclusion in a JSON string value (no surrounding quotes).
std::string json_escape(const std::string& s);

} // namespace paschen
