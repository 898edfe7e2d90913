#include "paschen/timestamps.hpp"

#include "test_support.hpp"
#include <iostream>
#include <string>

static paschen::CivilSeconds civil(int y, int mo, int d, int h, int mi, int s) {
  paschen::CivilSeconds t = 0;
  const bool ok = paschen::civil_to_seconds(y, mo, d, h, mi, s, &t);
  assert(ok);
  return t;
}

int main() {
  using namespace paschen;

  // Epoch and basic calendar arithmetic.
  {
    assert(civil(1970, 1, 1, 0, 0, 0) == 0);
    assert(civil(1970, 1, 2, 0, 0, 1) == 86401);
    assert(civil(2000, 3, 1, 0, 0, 0) - civil(2000, 2, 28, 0, 0, 0) == 2 * 86400);
    assert(civil(2023, 3, 1, 0, 0, 0) - civil(2023, 2, 28, 0, 0, 0) == 86400);

    CivilSeconds t = 0;
    assert(!civil_to_seconds(2023, 2, 29, 0, 0, 0, &t));
    assert(!civil_to_seconds(2024, 13, 1, 0, 0, 0, &t));
    assert(!civil_to_seconds(2024, 1, 1, 24, 0, 0, &t));
    assert(!civil_to_seconds(2024, 1, 1, 0, 60, 0, &t));
  }

  // Formatting, including times before the epoch.
  {
    assert(format_civil_seconds(0) == "1970-01-01 00:00:00");
    assert(format_civil_seconds(-1) == "1969-12-31 23:59:59");
    assert(format_civil_seconds(civil(2024, 2, 29, 13, 5, 9)) == "2024-02-29 13:05:09");
  }

  // Pressure log timestamps: MM/DD/YY hh:mm:ss AM/PM.
  {
    CivilSeconds t = 0;
    assert(parse_pressure_log_timestamp("03/01/24 10:05:00 AM", &t));
    assert(t == civil(2024, 3, 1, 10, 5, 0));

    assert(parse_pressure_log_timestamp("3/1/24 1:05:00 PM", &t));
    assert(t == civil(2024, 3, 1, 13, 5, 0));

    assert(parse_pressure_log_timestamp("03/01/24 12:00:00 AM", &t));
    assert(t == civil(2024, 3, 1, 0, 0, 0));

    assert(parse_pressure_log_timestamp("03/01/24 12:30:15 pm", &t));
    assert(t == civil(2024, 3, 1, 12, 30, 15));

    assert(parse_pressure_log_timestamp("  12/31/99 11:59:59 PM  ", &t));
    assert(t == civil(1999, 12, 31, 23, 59, 59));

    // Single-digit minutes or seconds, no space before the meridiem.
    assert(parse_pressure_log_timestamp("03/01/24 10:5:00 AM", &t));
    assert(t == civil(2024, 3, 1, 10, 5, 0));
    assert(parse_pressure_log_timestamp("03/01/24 10:05:00AM", &t));
    assert(t == civil(2024, 3, 1, 10, 5, 0));
    assert(parse_pressure_log_timestamp("03/01/24 10:05:7 pm", &t));
    assert(t == civil(2024, 3, 1, 22, 5, 7));

    const CivilSeconds keep = t;
    assert(!parse_pressure_log_timestamp("", &t));
    assert(!parse_pressure_log_timestamp("03/01/24 10:60:00 AM", &t));
    assert(!parse_pressure_log_timestamp("03/01/24 10:005:00 AM", &t));
    assert(!parse_pressure_log_timestamp("Date/Time", &t));
    assert(!parse_pressure_log_timestamp("03/01/24 13:00:00 PM", &t));
    assert(!parse_pressure_log_timestamp("03/01/24 00:10:00 AM", &t));
    assert(!parse_pressure_log_timestamp("02/30/24 10:00:00 AM", &t));
    assert(!parse_pressure_log_timestamp("03/01/2024 10:00:00 AM", &t));
    assert(!parse_pressure_log_timestamp("03/01/24 10:00:00", &t));
    assert(!parse_pressure_log_timestamp("03/01/24 10:00 AM", &t));
    assert(t == keep);
  }

  // Capture identity from the file name.
  {
    CivilSeconds t = 0;
    assert(parse_capture_timestamp("Pokit DSO Export 2024-03-01-10-06-00.csv", &t));
    assert(t == civil(2024, 3, 1, 10, 6, 0));

    assert(parse_capture_timestamp("runs/A/Pokit DSO Export 2024-03-01-23-59-58.csv", &t));
    assert(t == civil(2024, 3, 1, 23, 59, 58));

    assert(!parse_capture_timestamp("Pokit DSO Export.csv", &t));
    assert(!parse_capture_timestamp("Pokit DSO Export 2024-03-01.csv", &t));
    assert(!parse_capture_timestamp("Pokit DSO Export 2024-13-01-10-06-00.csv", &t));
    assert(!parse_capture_timestamp("Pokit DSO Export 2024-03-01-10-06-0x.csv", &t));
    assert(!parse_capture_timestamp("Pokit DSO Export 2024_03_01_10_06_00.csv", &t));
  }

  std::cout << "test_timestamps OK\n";
  return 0;
}
