#pragma once

#include "paschen/types.hpp"

#include <cstddef>
#include <optional>

namespace paschen {

// Nearest-neighbour lookup of a capture time in the pressure log.
//
// The series does not need to be sorted; every sample is scanned. When two or
// more samples are equally close to `query`, the one with the lowest index in
// the series wins.
//
// Returns an empty optional only when the series is empty.
std::optional<size_t> nearest_pressure_index(const PressureSeries& series, CivilSeconds query);

std::optional<double> nearest_pressure(const PressureSeries& series, CivilSeconds query);

} // namespace paschen
