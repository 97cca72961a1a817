#include "welch/periodogram.hpp"

#include <algorithm>
#include <complex>
#include <exception>
#include <stdexcept>
#include <thread>

namespace welch {

template <typename T>
void accumulate_periodograms(const T* signal,
                             const Segmenter& segments,
                             size_t first,
                             size_t count,
                             const Window<T>& window,
                             const FftPlan<T>& plan,
                             std::vector<T>* acc) {
  if (!signal || !acc) throw std::runtime_error("accumulate_periodograms: null argument");
  const size_t n = segments.length();
  if (acc->size() != n) throw std::runtime_error("accumulate_periodograms: accumulator length mismatch");
  if (first + count > segments.count()) {
    throw std::runtime_error("accumulate_periodograms: segment range out of bounds");
  }

  std::vector<std::complex<T>> buf;
  std::vector<std::complex<T>> scratch;
  for (size_t i = first; i < first + count; ++i) {
    const IndexSegment seg = segments.segment(i);
    windowed_transform(signal + seg.start, window, plan, &buf, &scratch);
    for (size_t k = 0; k < n; ++k) {
      (*acc)[k] += std::norm(buf[k]);
    }
  }
}

size_t max_thread_count() {
  const size_t hw = static_cast<size_t>(std::thread::hardware_concurrency());
  return hw == 0 ? 1 : hw;
}

size_t resolve_thread_count(size_t requested, size_t n_segments) {
  const size_t hw = max_thread_count();
  size_t t = requested;
  if (t == 0 || t > hw) t = hw;
  if (t > n_segments) t = n_segments;
  if (t == 0) t = 1;
  return t;
}

template <typename T>
std::vector<T> mean_periodogram(const T* signal,
                                const Segmenter& segments,
                                const Window<T>& window,
                                const FftPlan<T>& plan,
                                size_t n_threads) {
  const size_t n = segments.length();
  const size_t k_total = segments.count();
  if (k_total == 0) throw std::runtime_error("mean_periodogram: no segments");

  const size_t workers = resolve_thread_count(n_threads, k_total);

  std::vector<T> acc(n, T(0));
  if (workers <= 1) {
    accumulate_periodograms(signal, segments, 0, k_total, window, plan, &acc);
  } else {
    std::vector<std::vector<T>> partial(workers, std::vector<T>(n, T(0)));
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    const size_t base = k_total / workers;
    const size_t extra = k_total % workers;
    size_t first = 0;
    try {
      for (size_t t = 0; t < workers; ++t) {
        const size_t count = base + (t < extra ? 1 : 0);
        threads.emplace_back([&, t, first, count]() {
          try {
            accumulate_periodograms(signal, segments, first, count, window, plan, &partial[t]);
          } catch (...) {
            errors[t] = std::current_exception();
          }
        });
        first += count;
      }
    } catch (...) {
      // Thread creation failed: the workers already running must be joined
      // before the vector unwinds.
      for (auto& th : threads) {
        if (th.joinable()) th.join();
      }
      throw;
    }
    for (auto& th : threads) th.join();

    for (const auto& e : errors) {
      if (e) std::rethrow_exception(e);
    }
    for (const auto& p : partial) {
      for (size_t k = 0; k < n; ++k) acc[k] += p[k];
    }
  }

  const T inv_k = T(1) / static_cast<T>(k_total);
  for (T& v : acc) v *= inv_k;
  return acc;
}

template void accumulate_periodograms<float>(const float*, const Segmenter&, size_t, size_t,
                                             const Window<float>&, const FftPlan<float>&,
                                             std::vector<float>*);
template void accumulate_periodograms<double>(const double*, const Segmenter&, size_t, size_t,
                                              const Window<double>&, const FftPlan<double>&,
                                              std::vector<double>*);

template std::vector<float> mean_periodogram<float>(const float*, const Segmenter&,
                                                    const Window<float>&, const FftPlan<float>&,
                                                    size_t);
template std::vector<double> mean_periodogram<double>(const double*, const Segmenter&,
                                                      const Window<double>&, const FftPlan<double>&,
                                                      size_t);

} // namespace welch
