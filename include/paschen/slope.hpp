#pragma once

#include <vector>

namespace paschen {

// Median of the finite-difference slope dv/dt of a sampled signal.
//
// slopes[i] = (values[i+1] - values[i]) / (times[i+1] - times[i])
//
// Throws:
// - std::invalid_argument if the vectors differ in length or hold fewer than
//   two samples
// - std::domain_error if two consecutive time samples are equal
double median_slope(const std::vector<double>& times, const std::vector<double>& values);

} // namespace paschen
