#pragma once

#include <vector>

namespace welch {

// Folds a two-sided periodogram of length L into its one-sided form of length
// L/2 + 1. Bin 0 and, for even L, bin L/2 are kept as is; every other retained
// bin is doubled to account for its dropped negative-frequency mirror.
template <typename T>
std::vector<T> fold_one_sided(const std::vector<T>& two_sided);

// Spectral density: divides by fs * sum(w^2). Result in signal_unit^2 / Hz.
// Throws ConfigError unless fs > 0 and window_sum_sq > 0.
template <typename T>
std::vector<T> scale_spectral_density(std::vector<T> folded, T fs_hz, T window_sum_sq);

// Power spectrum: divides by sum(w)^2. Result in signal_unit^2.
// Throws ConfigError unless window_sum > 0.
template <typename T>
std::vector<T> scale_power_spectrum(std::vector<T> folded, T window_sum);

} // namespace welch
