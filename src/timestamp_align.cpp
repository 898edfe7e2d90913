#include "paschen/timestamp_align.hpp"

#include <cstdint>
#include <limits>

namespace paschen {

std::optional<size_t> nearest_pressure_index(const PressureSeries& series, CivilSeconds query) {
  if (series.empty()) return std::nullopt;

  size_t best = 0;
  uint64_t best_dist = std::numeric_limits<uint64_t>::max();
  for (size_t i = 0; i < series.size(); ++i) {
    const int64_t t = series[i].timestamp;
    // Distance in unsigned space so that far-apart timestamps cannot overflow.
    const uint64_t dist = (t >= query) ? static_cast<uint64_t>(t) - static_cast<uint64_t>(query)
                                       : static_cast<uint64_t>(query) - static_cast<uint64_t>(t);
    if (dist < best_dist) {
      best_dist = dist;
      best = i;
    }
  }
  return best;
}

std::optional<double> nearest_pressure(const PressureSeries& series, CivilSeconds query) {
  const std::optional<size_t> idx = nearest_pressure_index(series, query);
  if (!idx) return std::nullopt;
  return series[*idx].pressure;
}

} // namespace paschen
