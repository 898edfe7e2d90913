#pragma once

#include "paschen/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace paschen {

// Minimal dependency-free SVG charts for the pipeline outputs:
// - a line plot of one waveform channel (amplitude vs time)
// - a scatter of mean peak voltage vs pressure * length, one colour per folder

// Escape text for XML element bodies and attributes.
std::string svg_escape(const std::string& s);

// "Jet" colormap (blue -> cyan -> yellow -> red) for v in [0,1].
RGB jet_color(double v);

// Colour of series `index` out of `count`, spread evenly over jet_color().
std::string series_color(size_t index, size_t count);

// Tick spacing of 1, 2 or 5 times a power of ten giving roughly
// `target_ticks` intervals over `span`.
double nice_tick_step(double span, int target_ticks = 8);

struct LinePlotOptions {
  int width_px{1000};
  int height_px{600};

  // Longer series are decimated to at most this many polyline points.
  int max_points{5000};

  std::string title;
  std::string x_label;
  std::string y_label;
  std::string series_label;
};

// Throws std::invalid_argument if x and y differ in length or are empty,
// std::runtime_error if the file cannot be written.
void write_line_plot_svg(const std::string& path,
                         const std::vector<double>& x,
                         const std::vector<double>& y,
                         const LinePlotOptions& opt);

struct ScatterSeries {
  std::string label;
  std::vector<double> x;
  std::vector<double> y;
};

struct ScatterPlotOptions {
  int width_px{1000};
  int height_px{600};
  double marker_radius_px{4.0};

  // Start both axes at 0 even when all data is positive.
  bool axes_from_zero{true};

  std::string title;
  std::string x_label;
  std::string y_label;
};

// Non-finite points are skipped. Throws std::runtime_error if the file cannot
// be written.
void write_scatter_svg(const std::string& path,
                       const std::vector<ScatterSeries>& series,
                       const ScatterPlotOptions& opt);

} // namespace paschen
