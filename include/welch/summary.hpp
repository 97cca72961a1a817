#pragma once

#include "welch/welch_psd.hpp"

#include <string>

namespace welch {

// Multi-line, human-readable description of a resolved configuration, e.g.
//
//   Welch spectral density estimator:
//    - window              : hann
//    - signal length       :  100000
//    - segment length      :    4096
//    - overlap             :    2048
//    - number of segments  :      47
//    - transform           : radix-2 (4096)
//    - sampling frequency  : 10000 Hz
//    - frequency resolution: 2.44141 Hz
//
// The power spectrum variant omits the sampling frequency and reports the
// resolution in cycles/sample. No trailing newline.
std::string format_summary(const WelchConfig& cfg);

} // namespace welch
