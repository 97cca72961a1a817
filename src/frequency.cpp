#include "welch/frequency.hpp"

#include "welch/errors.hpp"

namespace welch {

template <typename T>
std::vector<T> frequency_axis_hz(size_t segment_length, T fs_hz) {
  if (segment_length == 0) throw ConfigError("frequency_axis_hz: segment length must be > 0");
  if (!(fs_hz > T(0))) throw ConfigError("frequency_axis_hz: fs_hz must be > 0");

  const size_t nfreq = segment_length / 2 + 1;
  std::vector<T> f(nfreq);
  for (size_t k = 0; k < nfreq; ++k) {
    f[k] = static_cast<T>(k) * fs_hz / static_cast<T>(segment_length);
  }
  return f;
}

template <typename T>
std::vector<T> normalized_frequency_axis(size_t segment_length) {
  if (segment_length == 0) throw ConfigError("normalized_frequency_axis: segment length must be > 0");

  const size_t nfreq = segment_length / 2 + 1;
  std::vector<T> f(nfreq);
  for (size_t k = 0; k < nfreq; ++k) {
    f[k] = static_cast<T>(k) / static_cast<T>(segment_length);
  }
  return f;
}

template std::vector<float> frequency_axis_hz<float>(size_t, float);
template std::vector<double> frequency_axis_hz<double>(size_t, double);
template std::vector<float> normalized_frequency_axis<float>(size_t);
template std::vector<double> normalized_frequency_axis<double>(size_t);

} // namespace welch
