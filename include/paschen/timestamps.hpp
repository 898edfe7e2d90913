#pragma once

#include "paschen/types.hpp"

#include <string>

namespace paschen {

// Convert a civil date-time to CivilSeconds. Returns false for an invalid
// calendar date or clock time.
bool civil_to_seconds(int year, int month, int day, int hour, int minute, int second,
                      CivilSeconds* out);

// Format CivilSeconds as "YYYY-MM-DD HH:MM:SS".
std::string format_civil_seconds(CivilSeconds t);

// Parse the pressure gauge date-time column: "MM/DD/YY hh:mm:ss AM" / "PM".
//
// - Month, day, hour, minutes and seconds accept one or two digits.
// - Whitespace before AM/PM is optional ("10:05:00AM").
// - Two-digit years map to 1969..2068 (POSIX %y convention).
// - 12 AM is midnight, 12 PM is noon.
// - AM/PM is case-insensitive.
bool parse_pressure_log_timestamp(const std::string& s, CivilSeconds* out);

// Parse the capture identity from a waveform file name of the form
//   "<prefix> YYYY-MM-DD-HH-MM-SS.<ext>"
// e.g. "Pokit DSO Export 2024-06-17-17-52-10.csv".
//
// The timestamp is the last space-separated token of the file stem. Any
// directory part of `file_name` is ignored.
bool parse_capture_timestamp(const std::string& file_name, CivilSeconds* out);

} // namespace paschen
