#pragma once

#include "welch/fft.hpp"
#include "welch/segments.hpp"
#include "welch/types.hpp"
#include "welch/window.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace welch {

struct WelchOptions {
  // Segment length L in samples.
  // If 0, derived from the signal length (see default_segment_length()).
  size_t segment_length{0};

  // Overlap between consecutive segments. An absolute sample count wins over
  // the fraction; otherwise overlap = floor(L * overlap_fraction).
  std::optional<size_t> overlap_samples;
  double overlap_fraction{0.5}; // 0..<1

  WindowKind window{WindowKind::Hann};

  // Target segment count used only when segment_length == 0.
  size_t n_segments{4};

  // Upper bound for the derived segment length (ignored for an explicit
  // segment_length). Long signals then get more than n_segments segments.
  size_t max_segment_length{4096};

  // Worker threads for the per-segment transforms (0 => hardware concurrency).
  size_t n_threads{1};
};

// Fully resolved and validated estimator parameters.
struct WelchConfig {
  EstimatorKind kind{EstimatorKind::SpectralDensity};
  size_t n_samples{0};
  size_t segment_length{0};
  size_t overlap{0};
  size_t n_segments{0};
  WindowKind window{WindowKind::Hann};
  double fs_hz{0.0}; // 0 for the power spectrum
  size_t n_threads{1};

  // Filled from the transform plan.
  size_t transform_size{0};
  std::string transform_algorithm;

  // fs / L in Hz for the spectral density, 1 / L (cycles/sample) otherwise.
  double frequency_resolution() const;
};

// Default segment length for a signal of n_samples.
//
// Welch's relation between signal length N, segment count K, segment length L
// and overlap fraction a is N = K*L - (K-1)*a*L, so with the target
// K = opt.n_segments:
//   L = floor(N / (K*(1-a) + a))
// or, with an absolute overlap O:
//   L = floor((N + (K-1)*O) / K)
// The result is capped at opt.max_segment_length and clamped to
// [min(8, N), N].
size_t default_segment_length(size_t n_samples, const WelchOptions& opt);

// Resolves and validates options for a signal of n_samples. fs_hz is ignored
// for EstimatorKind::PowerSpectrum. `where` prefixes error messages.
//
// Throws ConfigError or InsufficientDataError.
WelchConfig resolve_config(size_t n_samples,
                           EstimatorKind kind,
                           double fs_hz,
                           const WelchOptions& opt,
                           const std::string& where);

// Welch averaged, modified periodogram estimator.
//
// Holds a non-owning view of the signal: the caller keeps the samples alive
// (and unchanged) for as long as the estimator is used. Everything else
// (window, transform plan, segmenter) is computed once at construction; the
// estimator is immutable afterwards and periodogram() can be called
// repeatedly, also from several threads.
template <typename T>
class WelchEstimator {
public:
  const WelchConfig& config() const { return config_; }
  EstimatorKind kind() const { return config_.kind; }
  const Window<T>& window() const { return window_; }
  const Segmenter& segments() const { return segmenter_; }
  const FftPlan<T>& plan() const { return plan_; }

  // One-sided estimate of length L/2 + 1, all values >= 0.
  std::vector<T> periodogram() const;

  // Frequency of each periodogram bin: Hz for the spectral density,
  // cycles/sample in [0, 0.5] for the power spectrum.
  std::vector<T> frequency() const;

  Spectrum<T> estimate() const;

  T frequency_resolution() const { return static_cast<T>(config_.frequency_resolution()); }

  std::string summary() const;

  // Use make_spectral_density() / make_power_spectrum().
  WelchEstimator(const T* signal, size_t n, EstimatorKind kind, T fs_hz,
                 const WelchOptions& opt, const std::string& where);

private:
  const T* signal_{nullptr};
  WelchConfig config_;
  T fs_{0};
  Window<T> window_;
  FftPlan<T> plan_;
  Segmenter segmenter_;
};

// Spectral density (signal_unit^2 / Hz) of x sampled at fs_hz.
// fs_hz is converted to the sample type (it does not take part in deduction).
template <typename T>
WelchEstimator<T> make_spectral_density(const T* x,
                                        size_t n,
                                        typename std::vector<T>::value_type fs_hz,
                                        const WelchOptions& opt = {});

template <typename T>
WelchEstimator<T> make_spectral_density(const std::vector<T>& x,
                                        typename std::vector<T>::value_type fs_hz,
                                        const WelchOptions& opt = {}) {
  return make_spectral_density(x.data(), x.size(), fs_hz, opt);
}

// The estimator borrows the samples; a temporary vector would dangle.
template <typename T>
WelchEstimator<T> make_spectral_density(std::vector<T>&& x,
                                        typename std::vector<T>::value_type fs_hz,
                                        const WelchOptions& opt = {}) = delete;

// Power spectrum (signal_unit^2) of x on a normalized frequency axis.
template <typename T>
WelchEstimator<T> make_power_spectrum(const T* x, size_t n, const WelchOptions& opt = {});

template <typename T>
WelchEstimator<T> make_power_spectrum(const std::vector<T>& x, const WelchOptions& opt = {}) {
  return make_power_spectrum(x.data(), x.size(), opt);
}

template <typename T>
WelchEstimator<T> make_power_spectrum(std::vector<T>&& x, const WelchOptions& opt = {}) = delete;

extern template class WelchEstimator<float>;
extern template class WelchEstimator<double>;

} // namespace welch
