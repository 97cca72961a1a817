#pragma once

#include <string>

namespace welch {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines WELCH_VERSION_STRING for all targets that link against the
// welch library.
#ifndef WELCH_VERSION_STRING
  #define WELCH_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return WELCH_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

} // namespace welch
