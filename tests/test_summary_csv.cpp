#include "paschen/summary_csv.hpp"

#include "test_support.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

static std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream f(path);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(f, line)) out.push_back(line);
  return out;
}

int main() {
  using namespace paschen;

  const double nan = std::numeric_limits<double>::quiet_NaN();

  assert(csv_escape("plain") == "plain");
  assert(csv_escape("a,b") == "\"a,b\"");
  assert(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");

  assert(format_csv_number(0.1) == "0.1");
  assert(format_csv_number(-2.5) == "-2.5");
  assert(format_csv_number(1234567.0) == "1234567");
  assert(format_csv_number(nan).empty());
  assert(format_csv_number(std::optional<double>()).empty());
  assert(format_csv_number(std::optional<double>(7760.0)) == "7760");

  assert(summary_csv_columns().size() == 6);

  const std::string path = "tmp_paschen_summary.csv";
  {
    SummaryRow a;
    a.folder = "A";
    a.file_name = "Pokit DSO Export 2024-03-01-10-06-00.csv";
    a.channel = "CH1";
    a.mean_of_peaks = 6.0;
    a.stddev_of_peaks = nan;
    a.median_slope = 0.5;

    SummaryRow b;
    b.file_name = "odd, name.csv";
    b.channel = "CH2";
    b.mean_of_peaks = 10.0;
    b.stddev_of_peaks = 0.25;
    b.median_slope = nan;
    b.pressure = 200.0;

    write_summary_csv(path, {a, b});
    const auto lines = read_lines(path);
    assert(lines.size() == 3);
    assert(lines[0] == "File Name,Channel,Mean of Maxes,Standard Deviation of Maxes,Median Slope,Pressure (micron)");
    assert(lines[1] == "Pokit DSO Export 2024-03-01-10-06-00.csv,CH1,6,,0.5,");
    assert(lines[2] == "\"odd, name.csv\",CH2,10,0.25,,200");
  }
  std::remove(path.c_str());

  const std::string issues_path = "tmp_paschen_issues.csv";
  {
    ProcessingIssue is;
    is.level = IssueLevel::Warning;
    is.scope = "channel";
    is.path = "x.csv#CH1";
    is.message = "median_slope: repeated time sample 1, index 2";
    write_issues_csv(issues_path, {is});
    const auto lines = read_lines(issues_path);
    assert(lines.size() == 2);
    assert(lines[0] == "level,scope,path,message");
    assert(lines[1] == "warning,channel,x.csv#CH1,\"median_slope: repeated time sample 1, index 2\"");
  }
  std::remove(issues_path.c_str());

  std::cout << "test_summary_csv OK\n";
  return 0;
}
