#include "paschen/waveform_reader.hpp"

#include "test_support.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

static bool read_fails(const std::string& path, const std::string& content) {
  write_file(path, content);
  bool failed = false;
  try {
    (void)paschen::WaveformReader().read(path);
  } catch (const std::runtime_error&) {
    failed = true;
  }
  std::remove(path.c_str());
  return failed;
}

int main() {
  using namespace paschen;

  const std::string path = "tmp_paschen_waveform.csv";

  // Instrument preamble, CRLF line endings, quoted header cells and blank rows.
  {
    write_file(path,
               "\xEF\xBB\xBFPokit Pro DSO export\r\n"
               "Sample rate,1000\r\n"
               "\r\n"
               "\"Time (ms)\",\"CH1 (V)\",\"CH2 (V)\"\r\n"
               "0,0,0.5\r\n"
               "1,1.5,-0.5\r\n"
               "\r\n"
               "2,-2e-1,0.25\r\n");
    const WaveformCapture cap = WaveformReader().read(path);
    assert(cap.n_samples() == 3);
    assert(cap.n_channels() == 2);
    assert(cap.channels[0].name == "CH1 (V)");
    assert(cap.channels[1].name == "CH2 (V)");
    assert(cap.time_ms[2] == 2.0);
    assert(cap.channels[0].values.size() == 3);
    assert(cap.channels[1].values.size() == 3);
    assert(std::fabs(cap.channels[0].values[2] + 0.2) < 1e-12);
    assert(cap.channels[1].values[1] == -0.5);
    std::remove(path.c_str());
  }

  // Non-channel columns are ignored; repeated time values are allowed.
  {
    write_file(path,
               "Time (ms),Trigger,CH1\n"
               "0,x,1\n"
               "0,y,2\n"
               "1,z,3\n");
    const WaveformCapture cap = WaveformReader().read(path);
    assert(cap.n_channels() == 1);
    assert(cap.channels[0].name == "CH1");
    assert(cap.n_samples() == 3);
    std::remove(path.c_str());
  }

  // Custom column naming.
  {
    WaveformReaderOptions opt;
    opt.time_column = "Time (s)";
    opt.channel_prefix = "V";
    opt.delim = ';';
    write_file(path,
               "Time (s);Va;Vb\n"
               "0;1;2\n"
               "1;3;4\n");
    const WaveformCapture cap = WaveformReader(opt).read(path);
    assert(cap.n_channels() == 2);
    assert(cap.channels[1].values[1] == 4.0);
    std::remove(path.c_str());
  }

  // Failures reject the whole file.
  assert(read_fails(path, "Time (ms),CH1\n0,1\n1,abc\n2,3\n"));
  assert(read_fails(path, "Time (ms),CH1\n0,1\n1\n"));
  assert(read_fails(path, "Time (s),CH1\n0,1\n1,2\n"));
  assert(read_fails(path, "Time (ms),Voltage\n0,1\n1,2\n"));
  assert(read_fails(path, "Time (ms),CH1\n0,1\n2,2\n1,3\n"));
  assert(read_fails(path, "Time (ms),CH1\n0,1\n"));
  assert(read_fails(path, "no header here\n0,1\n1,2\n"));
  assert(read_fails(path, "Time (ms),CH1\n0,1\n1,nan\n"));

  {
    bool failed = false;
    try {
      (void)WaveformReader().read("tmp_paschen_does_not_exist.csv");
    } catch (const std::runtime_error&) {
      failed = true;
    }
    assert(failed);
  }

  {
    const std::string dir = "tmp_paschen_waveform_dir";
    std::filesystem::create_directories(dir);
    bool failed = false;
    try {
      (void)WaveformReader().read(dir);
    } catch (const std::runtime_error&) {
      failed = true;
    }
    assert(failed);
    std::filesystem::remove_all(dir);
  }

  std::cout << "test_waveform_reader OK\n";
  return 0;
}
