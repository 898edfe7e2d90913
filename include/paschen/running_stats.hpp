#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace paschen {

// Single-pass mean and sample spread of peak amplitudes (Welford update).
// Non-finite inputs are skipped. The spread of fewer than two values is NaN,
// which the summary CSV writes as an empty cell.
class RunningStats {
public:
  RunningStats() = default;

  explicit RunningStats(const std::vector<double>& values) {
    for (double v : values) add(v);
  }

  void add(double v) {
    if (!std::isfinite(v)) return;
    ++count_;
    const double before = v - mean_;
    mean_ += before / static_cast<double>(count_);
    sum_sq_ += before * (v - mean_);
  }

  size_t n() const { return count_; }

  double mean() const {
    return count_ == 0 ? std::numeric_limits<double>::quiet_NaN() : mean_;
  }

  double variance_sample() const {
    if (count_ < 2) return std::numeric_limits<double>::quiet_NaN();
    return sum_sq_ / static_cast<double>(count_ - 1);
  }

  double stddev_sample() const { return std::sqrt(variance_sample()); }

private:
  size_t count_{0};
  double mean_{0.0};
  double sum_sq_{0.0};
};

} // namespace paschen
