#pragma once

#include <cstddef>
#include <vector>

namespace welch {

// Bin frequencies in Hz for a length-L transform: k * fs / L, k = 0..L/2.
template <typename T>
std::vector<T> frequency_axis_hz(size_t segment_length, T fs_hz);

// Normalized bin frequencies (cycles/sample): k / L, k = 0..L/2, in [0, 0.5].
template <typename T>
std::vector<T> normalized_frequency_axis(size_t segment_length);

} // namespace welch
