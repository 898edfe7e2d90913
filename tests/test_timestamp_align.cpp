#include "paschen/timestamp_align.hpp"
#include "paschen/timestamps.hpp"

#include "test_support.hpp"
#include <iostream>

static paschen::CivilSeconds at(int h, int mi, int s = 0) {
  paschen::CivilSeconds t = 0;
  const bool ok = paschen::civil_to_seconds(2024, 3, 1, h, mi, s, &t);
  assert(ok);
  return t;
}

static paschen::PressureSample sample(paschen::CivilSeconds t, double p) {
  paschen::PressureSample s;
  s.timestamp = t;
  s.pressure = p;
  return s;
}

int main() {
  using namespace paschen;

  const PressureSeries series = {
    sample(at(10, 0), 100.0),
    sample(at(10, 5), 200.0),
    sample(at(10, 10), 300.0),
  };

  // A capture at 10:06 maps to the 10:05 reading.
  {
    const auto p = nearest_pressure(series, at(10, 6));
    assert(p.has_value());
    assert(*p == 200.0);
    assert(*nearest_pressure_index(series, at(10, 6)) == 1);
  }

  // Exact match, and queries outside the logged range.
  {
    assert(*nearest_pressure(series, at(10, 10)) == 300.0);
    assert(*nearest_pressure(series, at(9, 0)) == 100.0);
    assert(*nearest_pressure(series, at(23, 0)) == 300.0);
  }

  // Equidistant readings: the earliest index wins.
  {
    assert(*nearest_pressure_index(series, at(10, 2, 30)) == 0);
    assert(*nearest_pressure_index(series, at(10, 7, 30)) == 1);

    const PressureSeries dup = {
      sample(at(10, 0), 1.0),
      sample(at(10, 0), 2.0),
    };
    assert(*nearest_pressure(dup, at(10, 0)) == 1.0);
  }

  // File order is not assumed to be sorted.
  {
    const PressureSeries rev = {
      sample(at(10, 10), 300.0),
      sample(at(10, 5), 200.0),
      sample(at(10, 0), 100.0),
    };
    assert(*nearest_pressure(rev, at(10, 6)) == 200.0);
    assert(*nearest_pressure_index(rev, at(10, 6)) == 1);
  }

  // Empty log => no pressure.
  {
    const PressureSeries empty;
    assert(!nearest_pressure(empty, at(10, 0)).has_value());
    assert(!nearest_pressure_index(empty, at(10, 0)).has_value());
  }

  std::cout << "test_timestamp_align OK\n";
  return 0;
}
