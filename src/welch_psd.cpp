#include "welch/welch_psd.hpp"

#include "welch/errors.hpp"
#include "welch/frequency.hpp"
#include "welch/periodogram.hpp"
#include "welch/scaling.hpp"
#include "welch/summary.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace welch {

namespace {

// Runs a constructor that reports errors without the caller's name and
// rethrows them as the same error kind prefixed with `where`.
template <typename Make>
auto with_context(const std::string& where, Make make) -> decltype(make()) {
  try {
    return make();
  } catch (const InsufficientDataError& e) {
    throw InsufficientDataError(where + ": " + e.what());
  } catch (const ConfigError& e) {
    throw ConfigError(where + ": " + e.what());
  }
}

} // namespace

double WelchConfig::frequency_resolution() const {
  if (segment_length == 0) return 0.0;
  if (kind == EstimatorKind::SpectralDensity) return fs_hz / static_cast<double>(segment_length);
  return 1.0 / static_cast<double>(segment_length);
}

size_t default_segment_length(size_t n_samples, const WelchOptions& opt) {
  if (n_samples == 0) return 0;
  const size_t k = std::max<size_t>(opt.n_segments, 1);

  size_t l = 0;
  if (opt.overlap_samples) {
    l = (n_samples + (k - 1) * (*opt.overlap_samples)) / k;
  } else {
    const double a = opt.overlap_fraction;
    const double denom = static_cast<double>(k) * (1.0 - a) + a;
    l = static_cast<size_t>(std::floor(static_cast<double>(n_samples) / denom));
  }

  if (opt.max_segment_length > 0 && l > opt.max_segment_length) l = opt.max_segment_length;

  const size_t lo = std::min<size_t>(8, n_samples);
  if (l < lo) l = lo;
  if (l > n_samples) l = n_samples;

  // Symmetric Hann/Blackman of length 2 are all zeros; fall back to L = 1.
  if (l == 2 && (opt.window == WindowKind::Hann || opt.window == WindowKind::Blackman)) l = 1;
  return l;
}

WelchConfig resolve_config(size_t n_samples,
                           EstimatorKind kind,
                           double fs_hz,
                           const WelchOptions& opt,
                           const std::string& where) {
  if (n_samples == 0) throw InsufficientDataError(where + ": input signal is empty");

  if (kind == EstimatorKind::SpectralDensity) {
    if (!(fs_hz > 0.0) || !std::isfinite(fs_hz)) {
      throw ConfigError(where + ": sampling frequency must be > 0");
    }
  }
  if (!opt.overlap_samples) {
    if (!std::isfinite(opt.overlap_fraction) || opt.overlap_fraction < 0.0 ||
        opt.overlap_fraction >= 1.0) {
      throw ConfigError(where + ": overlap_fraction must be in [0,1)");
    }
  }
  if (opt.n_segments == 0) throw ConfigError(where + ": n_segments must be > 0");
  if (opt.max_segment_length == 0) throw ConfigError(where + ": max_segment_length must be > 0");

  WelchConfig cfg;
  cfg.kind = kind;
  cfg.n_samples = n_samples;
  cfg.window = opt.window;
  cfg.fs_hz = (kind == EstimatorKind::SpectralDensity) ? fs_hz : 0.0;

  cfg.segment_length = (opt.segment_length > 0) ? opt.segment_length
                                                 : default_segment_length(n_samples, opt);
  if (cfg.segment_length == 0) throw ConfigError(where + ": segment length must be > 0");
  if (cfg.segment_length > n_samples) {
    throw ConfigError(where + ": segment length (" + std::to_string(cfg.segment_length) +
                      ") exceeds signal length (" + std::to_string(n_samples) + ")");
  }

  if (opt.overlap_samples) {
    cfg.overlap = *opt.overlap_samples;
  } else {
    cfg.overlap = static_cast<size_t>(
        std::floor(static_cast<double>(cfg.segment_length) * opt.overlap_fraction));
  }
  if (cfg.overlap >= cfg.segment_length) {
    throw ConfigError(where + ": overlap (" + std::to_string(cfg.overlap) +
                      ") must be < segment length (" + std::to_string(cfg.segment_length) + ")");
  }

  cfg.n_segments = segment_count(n_samples, cfg.segment_length, cfg.overlap);
  if (cfg.n_segments == 0) {
    throw InsufficientDataError(where + ": not enough samples for one segment");
  }

  cfg.n_threads = resolve_thread_count(opt.n_threads, cfg.n_segments);
  return cfg;
}

template <typename T>
WelchEstimator<T>::WelchEstimator(const T* signal, size_t n, EstimatorKind kind, T fs_hz,
                                  const WelchOptions& opt, const std::string& where)
    : signal_(signal),
      config_(resolve_config(n, kind, static_cast<double>(fs_hz), opt, where)),
      fs_(fs_hz),
      window_(with_context(where, [this] {
        return Window<T>(config_.window, config_.segment_length);
      })),
      plan_(with_context(where, [this] { return FftPlan<T>(config_.segment_length); })),
      segmenter_(with_context(where, [this, n] {
        return Segmenter(n, config_.segment_length, config_.overlap);
      })) {
  if (!signal_) throw ConfigError(where + ": signal pointer is null");
  config_.transform_size = plan_.transform_size();
  config_.transform_algorithm = plan_.algorithm();
}

template <typename T>
std::vector<T> WelchEstimator<T>::periodogram() const {
  std::vector<T> folded =
      fold_one_sided(mean_periodogram(signal_, segmenter_, window_, plan_, config_.n_threads));
  if (config_.kind == EstimatorKind::SpectralDensity) {
    return scale_spectral_density(std::move(folded), fs_, window_.sum_sq());
  }
  return scale_power_spectrum(std::move(folded), window_.sum());
}

template <typename T>
std::vector<T> WelchEstimator<T>::frequency() const {
  if (config_.kind == EstimatorKind::SpectralDensity) {
    return frequency_axis_hz(config_.segment_length, fs_);
  }
  return normalized_frequency_axis<T>(config_.segment_length);
}

template <typename T>
Spectrum<T> WelchEstimator<T>::estimate() const {
  Spectrum<T> out;
  out.freqs = frequency();
  out.values = periodogram();
  return out;
}

template <typename T>
std::string WelchEstimator<T>::summary() const {
  return format_summary(config_);
}

template <typename T>
WelchEstimator<T> make_spectral_density(const T* x,
                                        size_t n,
                                        typename std::vector<T>::value_type fs_hz,
                                        const WelchOptions& opt) {
  return WelchEstimator<T>(x, n, EstimatorKind::SpectralDensity, fs_hz, opt, "make_spectral_density");
}

template <typename T>
WelchEstimator<T> make_power_spectrum(const T* x, size_t n, const WelchOptions& opt) {
  return WelchEstimator<T>(x, n, EstimatorKind::PowerSpectrum, T(0), opt, "make_power_spectrum");
}

template class WelchEstimator<float>;
template class WelchEstimator<double>;

template WelchEstimator<float> make_spectral_density<float>(const float*, size_t, float,
                                                            const WelchOptions&);
template WelchEstimator<double> make_spectral_density<double>(const double*, size_t, double,
                                                              const WelchOptions&);
template WelchEstimator<float> make_power_spectrum<float>(const float*, size_t, const WelchOptions&);
template WelchEstimator<double> make_power_spectrum<double>(const double*, size_t, const WelchOptions&);

} // namespace welch
