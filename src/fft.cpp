#include "welch/fft.hpp"

#include "welch/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace welch {

bool is_power_of_two(size_t n) {
  return n != 0 && (n & (n - 1)) == 0;
}

size_t next_power_of_two(size_t n) {
  if (n == 0) throw std::runtime_error("next_power_of_two: n must be > 0");
  size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

static size_t reverse_bits(size_t x, unsigned bits) {
  size_t y = 0;
  for (unsigned i = 0; i < bits; ++i) {
    y = (y << 1) | (x & 1);
    x >>= 1;
  }
  return y;
}

template <typename T>
static std::vector<std::complex<T>> forward_twiddles(size_t n) {
  std::vector<std::complex<T>> tw(n / 2);
  const double pi = std::acos(-1.0);
  for (size_t j = 0; j < tw.size(); ++j) {
    const double ang = -2.0 * pi * static_cast<double>(j) / static_cast<double>(n);
    tw[j] = std::complex<T>(static_cast<T>(std::cos(ang)), static_cast<T>(std::sin(ang)));
  }
  return tw;
}

// Iterative radix-2 transform using a precomputed table of forward twiddles
// for size a.size(). The inverse uses conjugated twiddles and is unscaled.
template <typename T>
static void radix2(std::vector<std::complex<T>>& a,
                   const std::vector<std::complex<T>>& twiddles,
                   bool inverse) {
  const size_t n = a.size();
  if (n <= 1) return;

  // bit-reversal permutation
  unsigned bits = 0;
  while ((size_t(1) << bits) < n) ++bits;

  for (size_t i = 0; i < n; ++i) {
    size_t j = reverse_bits(i, bits);
    if (j > i) std::swap(a[i], a[j]);
  }

  for (size_t len = 2; len <= n; len <<= 1) {
    const size_t half = len / 2;
    const size_t stride = n / len;
    for (size_t i = 0; i < n; i += len) {
      for (size_t j = 0; j < half; ++j) {
        std::complex<T> w = twiddles[j * stride];
        if (inverse) w = std::conj(w);
        const std::complex<T> u = a[i + j];
        const std::complex<T> v = a[i + j + half] * w;
        a[i + j] = u + v;
        a[i + j + half] = u - v;
      }
    }
  }
}

template <typename T>
void fft_inplace(std::vector<std::complex<T>>& a, bool inverse) {
  const size_t n = a.size();
  if (!is_power_of_two(n)) {
    throw std::runtime_error("fft_inplace: size must be a power of two");
  }

  radix2(a, forward_twiddles<T>(n), inverse);

  if (inverse) {
    for (auto& x : a) x /= static_cast<T>(n);
  }
}

template <typename T>
FftPlan<T>::FftPlan(size_t n) : n_(n) {
  if (n_ == 0) throw ConfigError("FftPlan: transform length must be > 0");

  if (is_power_of_two(n_)) {
    m_ = n_;
    twiddles_ = forward_twiddles<T>(m_);
    return;
  }

  m_ = next_power_of_two(2 * n_ - 1);
  twiddles_ = forward_twiddles<T>(m_);

  // k^2 is reduced modulo 2n before scaling so the chirp phase stays accurate
  // for long segments.
  const double pi = std::acos(-1.0);
  const unsigned long long two_n = 2ull * static_cast<unsigned long long>(n_);
  chirp_.resize(n_);
  for (size_t k = 0; k < n_; ++k) {
    const unsigned long long kk = static_cast<unsigned long long>(k);
    const unsigned long long r = (kk * kk) % two_n;
    const double ang = -pi * static_cast<double>(r) / static_cast<double>(n_);
    chirp_[k] = std::complex<T>(static_cast<T>(std::cos(ang)), static_cast<T>(std::sin(ang)));
  }

  std::vector<std::complex<T>> b(m_, std::complex<T>(0, 0));
  for (size_t k = 0; k < n_; ++k) {
    b[k] = std::conj(chirp_[k]);
    if (k != 0) b[m_ - k] = std::conj(chirp_[k]);
  }
  radix2(b, twiddles_, /*inverse=*/false);
  kernel_fft_ = std::move(b);
}

template <typename T>
std::string FftPlan<T>::algorithm() const {
  return uses_bluestein() ? "bluestein" : "radix-2";
}

template <typename T>
void FftPlan<T>::execute(std::vector<std::complex<T>>& data,
                         std::vector<std::complex<T>>& scratch) const {
  if (data.size() != n_) {
    throw std::runtime_error("FftPlan::execute: expected " + std::to_string(n_) +
                             " samples, got " + std::to_string(data.size()));
  }

  if (!uses_bluestein()) {
    radix2(data, twiddles_, /*inverse=*/false);
    return;
  }

  scratch.assign(m_, std::complex<T>(0, 0));
  for (size_t k = 0; k < n_; ++k) scratch[k] = data[k] * chirp_[k];

  radix2(scratch, twiddles_, /*inverse=*/false);
  for (size_t i = 0; i < m_; ++i) scratch[i] *= kernel_fft_[i];
  radix2(scratch, twiddles_, /*inverse=*/true);

  const T inv_m = T(1) / static_cast<T>(m_);
  for (size_t k = 0; k < n_; ++k) data[k] = scratch[k] * chirp_[k] * inv_m;
}

template <typename T>
void FftPlan<T>::execute(std::vector<std::complex<T>>& data) const {
  std::vector<std::complex<T>> scratch;
  execute(data, scratch);
}

template <typename T>
void windowed_transform(const T* segment,
                        const Window<T>& window,
                        const FftPlan<T>& plan,
                        std::vector<std::complex<T>>* out,
                        std::vector<std::complex<T>>* scratch) {
  if (!segment || !out || !scratch) {
    throw std::runtime_error("windowed_transform: null argument");
  }
  const size_t n = plan.size();
  if (window.size() != n) {
    throw std::runtime_error("windowed_transform: window length does not match plan length");
  }

  out->resize(n);
  const std::vector<T>& w = window.coefficients();
  for (size_t i = 0; i < n; ++i) {
    (*out)[i] = std::complex<T>(segment[i] * w[i], T(0));
  }
  plan.execute(*out, *scratch);
}

template void fft_inplace<float>(std::vector<std::complex<float>>&, bool);
template void fft_inplace<double>(std::vector<std::complex<double>>&, bool);

template class FftPlan<float>;
template class FftPlan<double>;

template void windowed_transform<float>(const float*, const Window<float>&, const FftPlan<float>&,
                                        std::vector<std::complex<float>>*,
                                        std::vector<std::complex<float>>*);
template void windowed_transform<double>(const double*, const Window<double>&, const FftPlan<double>&,
                                         std::vector<std::complex<double>>*,
                                         std::vector<std::complex<double>>*);

} // namespace welch
