#include "welch/scaling.hpp"

#include "welch/errors.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace welch {

template <typename T>
std::vector<T> fold_one_sided(const std::vector<T>& two_sided) {
  const size_t n = two_sided.size();
  if (n == 0) throw std::runtime_error("fold_one_sided: empty periodogram");

  const size_t nfreq = n / 2 + 1;
  std::vector<T> out(two_sided.begin(), two_sided.begin() + static_cast<std::ptrdiff_t>(nfreq));
  for (size_t k = 1; k < nfreq; ++k) {
    // Nyquist has no mirror image when n is even.
    if (n % 2 == 0 && k == n / 2) continue;
    out[k] *= T(2);
  }
  return out;
}

template <typename T>
std::vector<T> scale_spectral_density(std::vector<T> folded, T fs_hz, T window_sum_sq) {
  if (!(fs_hz > T(0)) || !std::isfinite(fs_hz)) {
    throw ConfigError("scale_spectral_density: fs_hz must be > 0");
  }
  if (!(window_sum_sq > T(0))) {
    throw ConfigError("scale_spectral_density: window sum of squares must be > 0");
  }
  const T scale = T(1) / (fs_hz * window_sum_sq);
  for (T& v : folded) v *= scale;
  return folded;
}

template <typename T>
std::vector<T> scale_power_spectrum(std::vector<T> folded, T window_sum) {
  if (!(window_sum > T(0))) {
    throw ConfigError("scale_power_spectrum: window sum must be > 0");
  }
  const T scale = T(1) / (window_sum * window_sum);
  for (T& v : folded) v *= scale;
  return folded;
}

template std::vector<float> fold_one_sided<float>(const std::vector<float>&);
template std::vector<double> fold_one_sided<double>(const std::vector<double>&);
template std::vector<float> scale_spectral_density<float>(std::vector<float>, float, float);
template std::vector<double> scale_spectral_density<double>(std::vector<double>, double, double);
template std::vector<float> scale_power_spectrum<float>(std::vector<float>, float);
template std::vector<double> scale_power_spectrum<double>(std::vector<double>, double);

} // namespace welch
