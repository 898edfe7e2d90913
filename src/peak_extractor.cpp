#include "paschen/peak_extractor.hpp"

#include "paschen/running_stats.hpp"

#include <algorithm>
#include <cmath>

namespace paschen {

std::vector<double> detect_peak_candidates(const std::vector<double>& series,
                                           const PeakExtractorOptions& opt) {
  std::vector<double> out;
  if (series.empty()) return out;

  double sum_abs = 0.0;
  for (double x : series) sum_abs += std::fabs(x);
  const double avg = sum_abs / static_cast<double>(series.size());

  double prev = 0.0;
  for (double x : series) {
    const double a = std::fabs(x);
    if (prev > std::max(opt.hysteresis_factor * a, avg)) {
      out.push_back(prev);
      prev = a;
    } else if (prev < a) {
      prev = a;
    }
  }
  return out;
}

std::vector<double> trim_peak_outliers(const std::vector<double>& peaks,
                                       const PeakExtractorOptions& opt) {
  if (peaks.empty()) return {};

  const RunningStats st(peaks);
  const double spread = (peaks.size() > 1) ? st.stddev_sample() : opt.fallback_spread;
  const double lo = st.mean() - opt.trim_sigma * spread;
  const double hi = st.mean() + opt.trim_sigma * spread;

  std::vector<double> out;
  out.reserve(peaks.size());
  for (double p : peaks) {
    if (p >= lo && p <= hi) out.push_back(p);
  }
  return out;
}

std::vector<double> extract_peaks(const std::vector<double>& series,
                                  const PeakExtractorOptions& opt) {
  std::vector<double> peaks = detect_peak_candidates(series, opt);
  if (peaks.empty()) return peaks;
  peaks.erase(peaks.begin());
  return trim_peak_outliers(peaks, opt);
}

} // namespace paschen
