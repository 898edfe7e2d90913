#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace paschen {

// Median via nth_element in O(n) average time. Modifies the input vector.
//
// Even-length input returns the mean of the two middle order statistics.
// Empty input returns NaN. NaN entries propagate: if any value is NaN the
// result is NaN.
inline double median_inplace(std::vector<double>* v) {
  if (!v || v->empty()) return std::numeric_limits<double>::quiet_NaN();
  for (double x : *v) {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
  }
  const size_t n = v->size();
  const size_t mid = n / 2;
  std::nth_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(mid), v->end());
  double med = (*v)[mid];
  if (n % 2 == 0) {
    // Lower middle is the largest element of the left partition.
    auto max_it = std::max_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(mid));
    med = 0.5 * (med + *max_it);
  }
  return med;
}

inline double median_inplace(std::vector<double>& v) { return median_inplace(&v); }

inline double median(const std::vector<double>& values) {
  std::vector<double> tmp = values;
  return median_inplace(&tmp);
}

} // namespace paschen
