#pragma once

#include "welch/window.hpp"

#include <complex>
#include <cstddef>
#include <string>
#include <vector>

namespace welch {

// Returns true if n is a power of two (and n > 0).
bool is_power_of_two(size_t n);

// Returns the smallest power of two >= n (n must be > 0).
size_t next_power_of_two(size_t n);

// In-place radix-2 FFT.
// - a.size() must be a power of two.
// - if inverse=true, computes inverse FFT (and divides by N).
template <typename T>
void fft_inplace(std::vector<std::complex<T>>& a, bool inverse);

// Precomputed forward DFT of a fixed length n (any n >= 1).
//
// Power-of-two lengths run the radix-2 transform directly. Other lengths use
// Bluestein's chirp-z algorithm: the DFT is rewritten as a linear convolution
// with a chirp, evaluated with radix-2 transforms of size
// next_power_of_two(2n - 1). Either way the cost is O(n log n) and the output
// is the exact length-n DFT (no change of bin spacing).
//
// The plan is immutable after construction; execute() is const and may be
// called concurrently from several threads as long as each thread passes its
// own data and scratch buffers.
template <typename T>
class FftPlan {
public:
  explicit FftPlan(size_t n);

  size_t size() const { return n_; }

  // Length of the radix-2 transforms actually run (n, or the Bluestein
  // convolution length).
  size_t transform_size() const { return m_; }

  bool uses_bluestein() const { return !chirp_.empty(); }

  // "radix-2" or "bluestein".
  std::string algorithm() const;

  // Forward transform of data (data.size() must equal size()).
  // scratch is resized as needed and may be reused across calls.
  void execute(std::vector<std::complex<T>>& data, std::vector<std::complex<T>>& scratch) const;
  void execute(std::vector<std::complex<T>>& data) const;

private:
  size_t n_{0};
  size_t m_{0};

  // Forward twiddles exp(-2*pi*i*j/m), j < m/2.
  std::vector<std::complex<T>> twiddles_;

  // Bluestein only: chirp exp(-i*pi*k^2/n), k < n, and the transformed
  // convolution kernel (length m).
  std::vector<std::complex<T>> chirp_;
  std::vector<std::complex<T>> kernel_fft_;
};

// Tapers segment[0..L) with the window and transforms it:
//   out[k] = sum_j window[j] * segment[j] * exp(-2*pi*i*j*k/L),  k < L
// L = window.size() = plan.size(). out and scratch are resized as needed.
template <typename T>
void windowed_transform(const T* segment,
                        const Window<T>& window,
                        const FftPlan<T>& plan,
                        std::vector<std::complex<T>>* out,
                        std::vector<std::complex<T>>* scratch);

extern template class FftPlan<float>;
extern template class FftPlan<double>;

} // namespace welch
