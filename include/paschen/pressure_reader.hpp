#pragma once

#include "paschen/types.hpp"

#include <string>

namespace paschen {

// Read a vacuum gauge log exported as CSV.
//
// Only the first two columns are used: date-time ("MM/DD/YY hh:mm:ss AM/PM")
// and pressure. Extra columns are ignored. Blank rows and rows whose date-time
// or pressure does not parse are dropped without error. The first non-blank
// line is treated as a header unless it parses as a sample.
//
// Samples are returned in file order.
//
// Throws std::runtime_error if the path is a directory, cannot be opened, or
// a read error occurs.
PressureSeries read_pressure_log(const std::string& path);

} // namespace paschen
