#include "paschen/svg_plot.hpp"

#include "test_support.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

static std::string slurp(const std::string& path) {
  std::ifstream f(path);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

static bool approx(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

int main() {
  using namespace paschen;

  assert(svg_escape("a<b & \"c\"") == "a&lt;b &amp; &quot;c&quot;");

  // Jet colormap endpoints and middle.
  {
    const RGB lo = jet_color(0.0);
    assert(lo.r == 0 && lo.g == 0 && lo.b == 128);
    const RGB mid = jet_color(0.5);
    assert(mid.r == 128 && mid.g == 255 && mid.b == 128);
    const RGB hi = jet_color(1.0);
    assert(hi.r == 128 && hi.g == 0 && hi.b == 0);
    const RGB clamped = jet_color(7.0);
    assert(clamped.r == hi.r && clamped.g == hi.g && clamped.b == hi.b);

    assert(series_color(0, 1) == "#000080");
    assert(series_color(1, 2) == "#800000");
  }

  {
    assert(approx(nice_tick_step(10.0), 2.0));
    assert(approx(nice_tick_step(8.0), 1.0));
    assert(approx(nice_tick_step(0.37), 0.05));
    assert(approx(nice_tick_step(0.0), 1.0));
  }

  const std::string line_path = "tmp_paschen_line.svg";
  {
    std::vector<double> t;
    std::vector<double> v;
    for (int i = 0; i < 20000; ++i) {
      t.push_back(0.01 * i);
      v.push_back(std::sin(0.01 * i));
    }
    LinePlotOptions opt;
    opt.title = "CH1 vs Time (ms) for <capture>";
    opt.x_label = "Time (ms)";
    opt.y_label = "CH1";
    write_line_plot_svg(line_path, t, v, opt);

    const std::string s = slurp(line_path);
    assert(s.find("<svg") != std::string::npos);
    assert(s.find("<polyline") != std::string::npos);
    assert(s.find("&lt;capture&gt;") != std::string::npos);
    assert(s.find("</svg>") != std::string::npos);

    bool thrown = false;
    try {
      write_line_plot_svg(line_path, {0, 1}, {0}, opt);
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
  }
  std::remove(line_path.c_str());

  const std::string scatter_path = "tmp_paschen_scatter.svg";
  {
    ScatterSeries a;
    a.label = "Magnets & foil";
    a.x = {100, 200, 300};
    a.y = {350, 330, 360};
    ScatterSeries b;
    b.label = "Gap 2";
    b.x = {150, std::nan("")};
    b.y = {400, 410};

    ScatterPlotOptions opt;
    opt.title = "Voltage vs Pressure * Length";
    write_scatter_svg(scatter_path, {a, b}, opt);

    const std::string s = slurp(scatter_path);
    assert(s.find("Magnets &amp; foil") != std::string::npos);
    assert(s.find("Gap 2") != std::string::npos);

    // Non-finite points are skipped: 3 + 1 markers plus 2 legend swatches.
    size_t n = 0;
    for (size_t pos = s.find("<circle"); pos != std::string::npos; pos = s.find("<circle", pos + 1)) ++n;
    assert(n == 6);

    // Axes start at zero.
    assert(s.find(">0</text>") != std::string::npos);
  }
  std::remove(scatter_path.c_str());

  // An empty scatter still renders a frame.
  {
    write_scatter_svg(scatter_path, {}, ScatterPlotOptions());
    assert(slurp(scatter_path).find("</svg>") != std::string::npos);
  }
  std::remove(scatter_path.c_str());

  std::cout << "test_svg_plot OK\n";
  return 0;
}
