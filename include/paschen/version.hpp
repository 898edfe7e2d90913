#pragma once

#include <string>

namespace paschen {

// Set from project(VERSION ...) by the root CMakeLists.txt.
#ifndef PASCHEN_VERSION_STRING
  #define PASCHEN_VERSION_STRING "0.0.0"
#endif

// Build identification strings recorded in paschen_run_meta.json.

inline std::string version_string() { return PASCHEN_VERSION_STRING; }

inline std::string build_type_string() {
#ifdef NDEBUG
  return "Release";
#else
  return "Debug";
#endif
}

inline std::string compiler_string() {
#if defined(__clang__)
  return "Clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__);
#elif defined(__GNUC__)
  return "GCC " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#else
  return "unknown";
#endif
}

inline std::string cpp_standard_string() {
  return "C++ " + std::to_string(__cplusplus);
}

} // namespace paschen
