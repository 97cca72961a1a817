#pragma once

#include "welch/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace welch {

// Taper applied to every segment before the transform.
//
// All families use the symmetric definition (denominator n - 1), so the first
// and last coefficients of Hann/Blackman are zero. A length-1 window is {1}.
//
// Coefficients are clamped to [0, 1]. Construction throws ConfigError for
// n == 0 and for degenerate windows whose sum or sum of squares is not
// strictly positive (e.g. Hann with n == 2), since the scaling step divides by
// both.
template <typename T>
class Window {
public:
  Window(WindowKind kind, size_t n);

  WindowKind kind() const { return kind_; }
  size_t size() const { return w_.size(); }

  const std::vector<T>& coefficients() const { return w_; }
  T operator[](size_t i) const { return w_[i]; }

  // Sum of the coefficients (coherent gain times n).
  T sum() const { return sum_; }

  // Sum of the squared coefficients (incoherent power gain times n).
  T sum_sq() const { return sum_sq_; }

private:
  WindowKind kind_{WindowKind::Hann};
  std::vector<T> w_;
  T sum_{0};
  T sum_sq_{0};
};

// Raw coefficient generator used by Window<T>. No degeneracy checks.
template <typename T>
std::vector<T> window_coefficients(WindowKind kind, size_t n);

// "rectangular", "hann", "hamming", "blackman".
std::string window_kind_name(WindowKind kind);

// Case-insensitive. Accepts the canonical names plus a few common aliases
// ("rect", "boxcar", "one", "hanning"). Throws ConfigError otherwise.
WindowKind parse_window_kind(const std::string& name);

extern template class Window<float>;
extern template class Window<double>;

} // namespace welch
