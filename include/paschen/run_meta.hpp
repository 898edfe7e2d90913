#pragma once

#include <string>
#include <vector>

namespace paschen {

// Write a *_run_meta.json sidecar describing one tool invocation.
//
// Keys written (top-level):
//   - Tool
//   - PaschenVersion
//   - BuildType
//   - Compiler
//   - CppStandard
//   - TimestampLocal
//   - TimestampUTC
//   - OutputDir
//   - InputPath (string or null)
//   - Outputs (array)
//
// Outputs located under the JSON file's directory are stored relative to it
// with '/' separators; others are stored as absolute paths. Duplicates are
// dropped.
//
// Returns true on success, false on write failure.
bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         const std::vector<std::string>& outputs);

} // namespace paschen
