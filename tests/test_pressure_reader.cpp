#include "paschen/pressure_reader.hpp"
#include "paschen/timestamps.hpp"

#include "test_support.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

int main() {
  using namespace paschen;

  const std::string path = "tmp_paschen_pressure.csv";
  {
    std::ofstream out(path, std::ios::binary);
    out << "Date/Time,Pressure (micron),Notes\r\n";
    out << "03/01/24 10:00:00 AM,100,start\r\n";
    out << "garbage,5\r\n";
    out << "03/01/24 10:05:00 AM,abc\r\n";
    out << "\r\n";
    out << "03/01/24 10:05:00 AM,200\r\n";
    out << "03/01/24 10:07:00 AM\r\n";
    out << "\"03/01/24 10:10:00 AM\",\" 300.5 \",extra,cells\r\n";
  }

  {
    const PressureSeries s = read_pressure_log(path);
    assert(s.size() == 3);

    CivilSeconds t0 = 0;
    assert(parse_pressure_log_timestamp("03/01/24 10:00:00 AM", &t0));
    assert(s[0].timestamp == t0);
    assert(s[0].pressure == 100.0);
    assert(s[1].timestamp == t0 + 300);
    assert(s[1].pressure == 200.0);
    assert(s[2].timestamp == t0 + 600);
    assert(s[2].pressure == 300.5);
  }
  std::remove(path.c_str());

  // A log with only a header yields an empty series, not an error.
  {
    std::ofstream out(path, std::ios::binary);
    out << "Date/Time,Pressure\n";
  }
  assert(read_pressure_log(path).empty());
  std::remove(path.c_str());

  {
    bool failed = false;
    try {
      (void)read_pressure_log("tmp_paschen_missing_pressure.csv");
    } catch (const std::runtime_error&) {
      failed = true;
    }
    assert(failed);
  }

  {
    const std::string dir = "tmp_paschen_pressure_dir";
    std::filesystem::create_directories(dir);
    bool failed = false;
    try {
      (void)read_pressure_log(dir);
    } catch (const std::runtime_error&) {
      failed = true;
    }
    assert(failed);
    std::filesystem::remove_all(dir);
  }

  std::cout << "test_pressure_reader OK\n";
  return 0;
}
