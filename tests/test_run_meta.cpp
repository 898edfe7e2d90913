#include "paschen/run_meta.hpp"
#include "paschen/version.hpp"

#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

int main() {
  using namespace paschen;
  namespace fs = std::filesystem;

  const fs::path dir = "tmp_paschen_run_meta";
  fs::remove_all(dir);
  fs::create_directories(dir);

  const std::string json_path = (dir / "paschen_run_meta.json").u8string();
  const std::vector<std::string> outputs = {
    (dir / "combined_summary_results.csv").u8string(),
    (dir / "plots" / "a \"b\".svg").u8string(),
    (dir / "combined_summary_results.csv").u8string(),
    "/elsewhere/x.svg",
    "",
  };
  assert(write_run_meta_json(json_path, "paschen_cli", dir.u8string(), "", outputs));

  std::string s;
  {
    std::ifstream f(json_path);
    std::ostringstream oss;
    oss << f.rdbuf();
    s = oss.str();
  }
  assert(s.find("\"Tool\": \"paschen_cli\"") != std::string::npos);
  assert(s.find("\"PaschenVersion\": \"" + version_string() + "\"") != std::string::npos);
  assert(s.find("\"InputPath\": null") != std::string::npos);
  assert(s.find("\"CppStandard\"") != std::string::npos);

  // Outputs: relative under the JSON directory, escaped, deduplicated,
  // absolute elsewhere, empty entries dropped.
  {
    const std::string csv_entry = "\"combined_summary_results.csv\"";
    const size_t first = s.find(csv_entry);
    assert(first != std::string::npos);
    assert(s.find(csv_entry, first + 1) == std::string::npos);
    assert(s.find("\"plots/a \\\"b\\\".svg\"") != std::string::npos);
    assert(s.find("\"/elsewhere/x.svg\"") != std::string::npos);
    assert(s.find("    \"\"") == std::string::npos);
    assert(s.find("tmp_paschen_run_meta/combined") == std::string::npos);
  }

  fs::remove_all(dir);
  std::cout << "test_run_meta OK\n";
  return 0;
}
