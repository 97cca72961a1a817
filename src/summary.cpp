#include "welch/summary.hpp"

#include "welch/window.hpp"

#include <iomanip>
#include <sstream>

namespace welch {

std::string estimator_kind_name(EstimatorKind kind) {
  switch (kind) {
    case EstimatorKind::SpectralDensity: return "spectral density";
    case EstimatorKind::PowerSpectrum: return "power spectrum";
  }
  return "unknown";
}

std::string format_summary(const WelchConfig& cfg) {
  std::ostringstream oss;
  oss << "Welch " << estimator_kind_name(cfg.kind) << " estimator:\n";
  oss << " - window              : " << window_kind_name(cfg.window) << "\n";
  oss << " - signal length       : " << std::setw(7) << cfg.n_samples << "\n";
  oss << " - segment length      : " << std::setw(7) << cfg.segment_length << "\n";
  oss << " - overlap             : " << std::setw(7) << cfg.overlap << "\n";
  oss << " - number of segments  : " << std::setw(7) << cfg.n_segments << "\n";
  oss << " - transform           : "
      << (cfg.transform_algorithm.empty() ? std::string("n/a") : cfg.transform_algorithm)
      << " (" << cfg.transform_size << ")\n";
  if (cfg.n_threads > 1) {
    oss << " - threads             : " << std::setw(7) << cfg.n_threads << "\n";
  }
  if (cfg.kind == EstimatorKind::SpectralDensity) {
    oss << " - sampling frequency  : " << std::setprecision(6) << cfg.fs_hz << " Hz\n";
    oss << " - frequency resolution: " << std::setprecision(6) << cfg.frequency_resolution() << " Hz";
  } else {
    oss << " - frequency resolution: " << std::setprecision(6) << cfg.frequency_resolution()
        << " cycles/sample";
  }
  return oss.str();
}

} // namespace welch
