#include "paschen/run_meta.hpp"
#include "paschen/utils.hpp"
#include "paschen/version.hpp"

#include <filesystem>
#include <sstream>
#include <unordered_set>

namespace paschen {

namespace {

// Relative path of `p` under `base` with '/' separators, or the absolute
// path when `p` lies outside `base`.
static std::string output_entry(const std::filesystem::path& base, const std::string& p) {
  std::error_code ec;
  const std::filesystem::path abs = std::filesystem::absolute(std::filesystem::u8path(p), ec);
  if (ec) return p;
  const std::filesystem::path norm = abs.lexically_normal();

  const std::filesystem::path rel = norm.lexically_relative(base);
  if (!rel.empty()) {
    const std::string r = rel.generic_u8string();
    if (r != ".." && !starts_with(r, "../")) return r;
  }
  return norm.generic_u8string();
}

} // namespace

bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         const std::vector<std::string>& outputs) {
  std::ostringstream out;

  std::error_code ec;
  std::filesystem::path base =
      std::filesystem::absolute(std::filesystem::u8path(json_path), ec).parent_path();
  if (ec) base = std::filesystem::current_path();
  base = base.lexically_normal();

  std::vector<std::string> entries;
  entries.reserve(outputs.size());
  std::unordered_set<std::string> seen;
  for (const auto& o : outputs) {
    if (o.empty()) continue;
    const std::string e = output_entry(base, o);
    if (seen.insert(e).second) entries.push_back(e);
  }

  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(tool) << "\",\n";
  out << "  \"PaschenVersion\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(compiler_string()) << "\",\n";
  out << "  \"CppStandard\": \"" << json_escape(cpp_standard_string()) << "\",\n";
  out << "  \"TimestampLocal\": \"" << json_escape(now_string_local()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(outdir) << "\",\n";
  out << "  \"InputPath\": ";
  if (input_path.empty()) {
    out << "null";
  } else {
    out << "\"" << json_escape(input_path) << "\"";
  }
  out << ",\n";

  out << "  \"Outputs\": [\n";
  for (size_t i = 0; i < entries.size(); ++i) {
    out << "    \"" << json_escape(entries[i]) << "\"";
    if (i + 1 < entries.size()) out << ",";
    out << "\n";
  }
  out << "  ]\n";
  out << "}\n";
  return write_text_file_atomic(json_path, out.str());
}

} // namespace paschen
