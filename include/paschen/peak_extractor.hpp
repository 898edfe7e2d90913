#pragma once

#include <vector>

namespace paschen {

// Breakdown peak detection on a single oscilloscope channel.
//
// The detector tracks a running maximum of |x|. The running maximum is
// confirmed as a peak once the signal has decayed below both
// hysteresis_factor * |x| and the mean absolute amplitude of the whole
// channel; tracking then restarts from the current sample. Small chatter near
// an already-tracked peak never re-triggers because it does not decay far
// enough.
//
// extract_peaks() then:
//   1) drops the first confirmed peak (the tracker starts from 0, so the first
//      confirmation is a warm-up artifact), and
//   2) keeps peaks inside mean +/- trim_sigma * spread, where spread is the
//      sample standard deviation (N-1) of the remaining peaks, or
//      fallback_spread when fewer than two remain.
struct PeakExtractorOptions {
  double hysteresis_factor{4.0};
  double trim_sigma{2.0};
  double fallback_spread{10.0};
};

// Raw confirmed maxima in detection order (warm-up detection included, no
// outlier trim). Values are absolute amplitudes.
std::vector<double> detect_peak_candidates(const std::vector<double>& series,
                                           const PeakExtractorOptions& opt = {});

// Accepted peaks in detection order. Returns an empty vector when zero or one
// candidate was confirmed.
std::vector<double> extract_peaks(const std::vector<double>& series,
                                  const PeakExtractorOptions& opt = {});

// Outlier trim used by extract_peaks(), exposed for testing.
std::vector<double> trim_peak_outliers(const std::vector<double>& peaks,
                                       const PeakExtractorOptions& opt = {});

} // namespace paschen
