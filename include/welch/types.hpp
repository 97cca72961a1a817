#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace welch {

enum class WindowKind {
  Rectangular,
  Hann,
  Hamming,
  Blackman,
};

// Which normalization the estimator applies to the folded periodogram.
enum class EstimatorKind {
  SpectralDensity, // signal_unit^2 / Hz, frequency axis in Hz
  PowerSpectrum,   // signal_unit^2, normalized frequency axis (cycles/sample)
};

std::string estimator_kind_name(EstimatorKind kind);

// One-sided estimate paired with its frequency axis.
template <typename T>
struct Spectrum {
  std::vector<T> freqs;   // length = segment_length / 2 + 1
  std::vector<T> values;  // same length, all >= 0
};

} // namespace welch
