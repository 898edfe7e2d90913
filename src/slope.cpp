#include "paschen/slope.hpp"

#include "paschen/robust_stats.hpp"

#include <sstream>
#include <stdexcept>

namespace paschen {

double median_slope(const std::vector<double>& times, const std::vector<double>& values) {
  if (times.size() != values.size()) {
    throw std::invalid_argument("median_slope: times and values differ in length");
  }
  if (times.size() < 2) {
    throw std::invalid_argument("median_slope: need at least 2 samples");
  }

  std::vector<double> slopes;
  slopes.reserve(times.size() - 1);
  for (size_t i = 1; i < times.size(); ++i) {
    const double dt = times[i] - times[i - 1];
    if (dt == 0.0) {
      std::ostringstream oss;
      oss << "median_slope: repeated time sample " << times[i] << " at index " << i;
      throw std::domain_error(oss.str());
    }
    slopes.push_back((values[i] - values[i - 1]) / dt);
  }
  return median_inplace(&slopes);
}

} // namespace paschen
