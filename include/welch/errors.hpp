#pragma once

#include <stdexcept>
#include <string>

namespace welch {

// Invalid estimator parameters (segment length, overlap, window, sampling
// rate). Always raised while building an estimator, never while computing.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The signal cannot provide a single full segment.
class InsufficientDataError : public std::runtime_error {
public:
  explicit InsufficientDataError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace welch
