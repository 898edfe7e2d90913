#include "paschen/svg_plot.hpp"

#include "paschen/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace paschen {

namespace {

struct AxisRange {
  double lo{0.0};
  double hi{1.0};
};

// Plot-area margins in pixels.
constexpr int kMarginLeft = 90;
constexpr int kMarginRight = 30;
constexpr int kMarginTop = 40;
constexpr int kMarginBottom = 60;

static AxisRange finite_range(const std::vector<double>& v, bool from_zero) {
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (double x : v) {
    if (!std::isfinite(x)) continue;
    lo = std::min(lo, x);
    hi = std::max(hi, x);
  }
  if (!std::isfinite(lo)) {
    lo = 0.0;
    hi = 1.0;
  }
  if (from_zero) {
    lo = std::min(0.0, lo);
    hi = std::max(0.0, hi);
  }
  if (!(hi > lo)) {
    // Flat data: open a symmetric window so the line stays visible.
    const double pad = (lo == 0.0) ? 1.0 : std::fabs(lo) * 0.1;
    if (from_zero && lo >= 0.0) {
      hi = lo + pad;
    } else {
      lo -= pad;
      hi += pad;
    }
    return AxisRange{lo, hi};
  }
  const double pad = 0.05 * (hi - lo);
  if (!(from_zero && lo == 0.0)) lo -= pad;
  hi += pad;
  return AxisRange{lo, hi};
}

// Tick positions in [lo, hi], computed by index so that a step far below the
// magnitude of lo cannot stall the loop.
static std::vector<double> tick_positions(const AxisRange& r, double step) {
  std::vector<double> out;
  const double first = std::ceil(r.lo / step) * step;
  for (int k = 0; k <= 200; ++k) {
    const double v = first + static_cast<double>(k) * step;
    if (v > r.hi + 1e-9 * step) break;
    out.push_back(v);
  }
  return out;
}

static std::string tick_label(double v, double step) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  if (std::fabs(v) < step * 1e-9) v = 0.0;
  const int decimals = (step >= 1.0) ? 0 : static_cast<int>(std::ceil(-std::log10(step)));
  oss << std::fixed << std::setprecision(std::min(decimals, 9)) << v;
  return oss.str();
}

struct Frame {
  int width{0};
  int height{0};
  int plot_w{0};
  int plot_h{0};
  AxisRange xr;
  AxisRange yr;

  double to_x(double v) const {
    return kMarginLeft + (v - xr.lo) / (xr.hi - xr.lo) * static_cast<double>(plot_w);
  }
  double to_y(double v) const {
    return kMarginTop + (1.0 - (v - yr.lo) / (yr.hi - yr.lo)) * static_cast<double>(plot_h);
  }
};

static Frame make_frame(int width, int height, AxisRange xr, AxisRange yr) {
  Frame fr;
  fr.width = std::max(width, kMarginLeft + kMarginRight + 100);
  fr.height = std::max(height, kMarginTop + kMarginBottom + 100);
  fr.plot_w = fr.width - kMarginLeft - kMarginRight;
  fr.plot_h = fr.height - kMarginTop - kMarginBottom;
  fr.xr = xr;
  fr.yr = yr;
  return fr;
}

static void begin_svg(std::ostringstream& f, const Frame& fr) {
  f << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  f << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" "
    << "width=\"" << fr.width << "\" height=\"" << fr.height << "\" "
    << "viewBox=\"0 0 " << fr.width << " " << fr.height << "\">\n";
  f << "<rect x=\"0\" y=\"0\" width=\"" << fr.width << "\" height=\"" << fr.height
    << "\" fill=\"white\"/>\n";
}

// Grid, axes, tick labels, axis titles and the plot title.
static void draw_axes(std::ostringstream& f, const Frame& fr, const std::string& title,
                      const std::string& x_label, const std::string& y_label) {
  const double x_step = nice_tick_step(fr.xr.hi - fr.xr.lo);
  const double y_step = nice_tick_step(fr.yr.hi - fr.yr.lo);
  const std::vector<double> x_ticks = tick_positions(fr.xr, x_step);
  const std::vector<double> y_ticks = tick_positions(fr.yr, y_step);
  const int left = kMarginLeft;
  const int right = kMarginLeft + fr.plot_w;
  const int top = kMarginTop;
  const int bottom = kMarginTop + fr.plot_h;

  f << "<g stroke=\"#e6e6e6\" stroke-width=\"1\">\n";
  for (double x : x_ticks) {
    const double px = fr.to_x(x);
    f << "<line x1=\"" << px << "\" y1=\"" << top << "\" x2=\"" << px << "\" y2=\"" << bottom << "\"/>\n";
  }
  for (double y : y_ticks) {
    const double py = fr.to_y(y);
    f << "<line x1=\"" << left << "\" y1=\"" << py << "\" x2=\"" << right << "\" y2=\"" << py << "\"/>\n";
  }
  f << "</g>\n";

  f << "<rect x=\"" << left << "\" y=\"" << top << "\" width=\"" << fr.plot_w << "\" height=\""
    << fr.plot_h << "\" fill=\"none\" stroke=\"#333\" stroke-width=\"1\"/>\n";

  f << "<g font-family=\"sans-serif\" font-size=\"12\" fill=\"#333\">\n";
  for (double x : x_ticks) {
    f << "<text x=\"" << fr.to_x(x) << "\" y=\"" << (bottom + 18) << "\" text-anchor=\"middle\">"
      << tick_label(x, x_step) << "</text>\n";
  }
  for (double y : y_ticks) {
    f << "<text x=\"" << (left - 8) << "\" y=\"" << (fr.to_y(y) + 4) << "\" text-anchor=\"end\">"
      << tick_label(y, y_step) << "</text>\n";
  }
  f << "<text x=\"" << (left + fr.plot_w / 2) << "\" y=\"" << (fr.height - 14)
    << "\" text-anchor=\"middle\">" << svg_escape(x_label) << "</text>\n";
  f << "<text x=\"20\" y=\"" << (top + fr.plot_h / 2) << "\" text-anchor=\"middle\" transform=\"rotate(-90 20 "
    << (top + fr.plot_h / 2) << ")\">" << svg_escape(y_label) << "</text>\n";
  f << "</g>\n";

  f << "<text x=\"" << (left + fr.plot_w / 2) << "\" y=\"24\" text-anchor=\"middle\" "
    << "font-family=\"sans-serif\" font-size=\"15\" fill=\"#111\">" << svg_escape(title) << "</text>\n";
}

static void draw_legend(std::ostringstream& f, const Frame& fr,
                        const std::vector<std::pair<std::string, std::string>>& entries) {
  if (entries.empty()) return;
  const int x = kMarginLeft + fr.plot_w - 10;
  int y = kMarginTop + 18;
  f << "<g font-family=\"sans-serif\" font-size=\"12\" fill=\"#111\">\n";
  for (const auto& e : entries) {
    f << "<circle cx=\"" << (x - 6) << "\" cy=\"" << (y - 4) << "\" r=\"5\" fill=\"" << e.second << "\"/>\n";
    f << "<text x=\"" << (x - 16) << "\" y=\"" << y << "\" text-anchor=\"end\">" << svg_escape(e.first)
      << "</text>\n";
    y += 18;
  }
  f << "</g>\n";
}

static void save_svg(const std::string& path, const std::string& content) {
  if (!write_text_file_atomic(path, content)) {
    throw std::runtime_error("Failed to write SVG: " + path);
  }
}

} // namespace

std::string svg_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

RGB jet_color(double v) {
  if (!std::isfinite(v)) v = 0.0;
  v = std::min(1.0, std::max(0.0, v));
  auto channel = [](double x) {
    const double c = std::min(1.0, std::max(0.0, 1.5 - std::fabs(x)));
    return static_cast<uint8_t>(std::lround(c * 255.0));
  };
  RGB c;
  c.r = channel(4.0 * v - 3.0);
  c.g = channel(4.0 * v - 2.0);
  c.b = channel(4.0 * v - 1.0);
  return c;
}

std::string series_color(size_t index, size_t count) {
  const double v = (count > 1) ? static_cast<double>(index) / static_cast<double>(count - 1) : 0.0;
  const RGB c = jet_color(v);
  std::ostringstream oss;
  oss << "#" << std::hex << std::setfill('0')
      << std::setw(2) << static_cast<int>(c.r)
      << std::setw(2) << static_cast<int>(c.g)
      << std::setw(2) << static_cast<int>(c.b);
  return oss.str();
}

double nice_tick_step(double span, int target_ticks) {
  if (!(span > 0.0) || !std::isfinite(span)) return 1.0;
  if (target_ticks < 1) target_ticks = 1;
  const double raw = span / static_cast<double>(target_ticks);
  const double mag = std::pow(10.0, std::floor(std::log10(raw)));
  const double norm = raw / mag;
  double nice = 10.0;
  if (norm <= 1.0) nice = 1.0;
  else if (norm <= 2.0) nice = 2.0;
  else if (norm <= 5.0) nice = 5.0;
  return nice * mag;
}

void write_line_plot_svg(const std::string& path,
                         const std::vector<double>& x,
                         const std::vector<double>& y,
                         const LinePlotOptions& opt) {
  if (x.size() != y.size()) throw std::invalid_argument("line plot: x and y differ in length");
  if (x.empty()) throw std::invalid_argument("line plot: no samples");

  const Frame fr = make_frame(opt.width_px, opt.height_px,
                              finite_range(x, false), finite_range(y, false));

  std::ostringstream f;
  f.imbue(std::locale::classic());
  begin_svg(f, fr);
  draw_axes(f, fr, opt.title, opt.x_label, opt.y_label);

  const size_t max_points = static_cast<size_t>(std::max(opt.max_points, 200));
  size_t step = 1;
  if (x.size() > max_points) {
    step = static_cast<size_t>(std::ceil(static_cast<double>(x.size()) / static_cast<double>(max_points)));
  }

  const std::string color = series_color(0, 1);
  f << "<polyline fill=\"none\" stroke=\"" << color << "\" stroke-width=\"1\" points=\"";
  bool first = true;
  for (size_t i = 0; i < x.size(); i += step) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
    if (!first) f << ' ';
    f << std::fixed << std::setprecision(2) << fr.to_x(x[i]) << ',' << fr.to_y(y[i]);
    first = false;
  }
  f << "\"/>\n";
  f << std::defaultfloat;

  if (!opt.series_label.empty()) {
    draw_legend(f, fr, {{opt.series_label, color}});
  }
  f << "</svg>\n";
  save_svg(path, f.str());
}

void write_scatter_svg(const std::string& path,
                       const std::vector<ScatterSeries>& series,
                       const ScatterPlotOptions& opt) {
  std::vector<double> all_x;
  std::vector<double> all_y;
  for (const auto& s : series) {
    const size_t n = std::min(s.x.size(), s.y.size());
    for (size_t i = 0; i < n; ++i) {
      if (!std::isfinite(s.x[i]) || !std::isfinite(s.y[i])) continue;
      all_x.push_back(s.x[i]);
      all_y.push_back(s.y[i]);
    }
  }

  const Frame fr = make_frame(opt.width_px, opt.height_px,
                              finite_range(all_x, opt.axes_from_zero),
                              finite_range(all_y, opt.axes_from_zero));

  std::ostringstream f;
  f.imbue(std::locale::classic());
  begin_svg(f, fr);
  draw_axes(f, fr, opt.title, opt.x_label, opt.y_label);

  std::vector<std::pair<std::string, std::string>> legend;
  for (size_t k = 0; k < series.size(); ++k) {
    const auto& s = series[k];
    const std::string color = series_color(k, series.size());
    legend.emplace_back(s.label, color);

    f << "<g fill=\"" << color << "\" fill-opacity=\"0.85\" stroke=\"#222\" stroke-width=\"0.5\">\n";
    const size_t n = std::min(s.x.size(), s.y.size());
    for (size_t i = 0; i < n; ++i) {
      if (!std::isfinite(s.x[i]) || !std::isfinite(s.y[i])) continue;
      f << "<circle cx=\"" << fr.to_x(s.x[i]) << "\" cy=\"" << fr.to_y(s.y[i])
        << "\" r=\"" << opt.marker_radius_px << "\"/>\n";
    }
    f << "</g>\n";
  }

  draw_legend(f, fr, legend);
  f << "</svg>\n";
  save_svg(path, f.str());
}

} // namespace paschen
