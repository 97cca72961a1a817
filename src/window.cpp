#include "welch/window.hpp"

#include "welch/errors.hpp"
#include "welch/utils.hpp"

#include <algorithm>
#include <cmath>

namespace welch {

template <typename T>
std::vector<T> window_coefficients(WindowKind kind, size_t n) {
  std::vector<T> w(n, T(1));
  if (n <= 1 || kind == WindowKind::Rectangular) return w;

  const T pi = std::acos(T(-1));
  const T denom = static_cast<T>(n - 1);
  for (size_t i = 0; i < n; ++i) {
    const T x = T(2) * pi * static_cast<T>(i) / denom;
    T v = T(1);
    switch (kind) {
      case WindowKind::Hann:
        v = T(0.5) - T(0.5) * std::cos(x);
        break;
      case WindowKind::Hamming:
        v = T(0.54) - T(0.46) * std::cos(x);
        break;
      case WindowKind::Blackman:
        v = T(0.42) - T(0.5) * std::cos(x) + T(0.08) * std::cos(T(2) * x);
        break;
      case WindowKind::Rectangular:
        break;
    }
    // Blackman end points evaluate to a tiny negative number in floating point.
    w[i] = std::min(T(1), std::max(T(0), v));
  }
  return w;
}

template <typename T>
Window<T>::Window(WindowKind kind, size_t n) : kind_(kind) {
  if (n == 0) throw ConfigError("Window: length must be > 0");

  w_ = window_coefficients<T>(kind, n);
  for (T wi : w_) {
    sum_ += wi;
    sum_sq_ += wi * wi;
  }
  if (!(sum_ > T(0)) || !(sum_sq_ > T(0))) {
    throw ConfigError("Window: " + window_kind_name(kind) + " window of length " +
                      std::to_string(n) + " is all zeros");
  }
}

std::string window_kind_name(WindowKind kind) {
  switch (kind) {
    case WindowKind::Rectangular: return "rectangular";
    case WindowKind::Hann: return "hann";
    case WindowKind::Hamming: return "hamming";
    case WindowKind::Blackman: return "blackman";
  }
  return "unknown";
}

WindowKind parse_window_kind(const std::string& name) {
  const std::string s = to_lower(trim(name));
  if (s == "rectangular" || s == "rect" || s == "boxcar" || s == "one") return WindowKind::Rectangular;
  if (s == "hann" || s == "hanning") return WindowKind::Hann;
  if (s == "hamming") return WindowKind::Hamming;
  if (s == "blackman") return WindowKind::Blackman;
  throw ConfigError("parse_window_kind: unknown window '" + name +
                    "' (expected rectangular|hann|hamming|blackman)");
}

template std::vector<float> window_coefficients<float>(WindowKind, size_t);
template std::vector<double> window_coefficients<double>(WindowKind, size_t);

template class Window<float>;
template class Window<double>;

} // namespace welch
