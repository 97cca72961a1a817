#pragma once

#include "welch/fft.hpp"
#include "welch/segments.hpp"
#include "welch/window.hpp"

#include <cstddef>
#include <vector>

namespace welch {

// Adds |X_k|^2 of the tapered transform of every segment in
// [first, first + count) into acc (length L, not cleared).
template <typename T>
void accumulate_periodograms(const T* signal,
                             const Segmenter& segments,
                             size_t first,
                             size_t count,
                             const Window<T>& window,
                             const FftPlan<T>& plan,
                             std::vector<T>* acc);

// Mean two-sided periodogram (length L) over all segments:
//   P[k] = (1/K) * sum_i |DFT(w * x_i)[k]|^2
//
// n_threads > 1 splits the segments into contiguous blocks, one per worker.
// Each worker sums its block into a private accumulator; the partial sums are
// then added in worker order, so the result is bit-identical for a given
// thread count. n_threads == 0 uses std::thread::hardware_concurrency().
template <typename T>
std::vector<T> mean_periodogram(const T* signal,
                                const Segmenter& segments,
                                const Window<T>& window,
                                const FftPlan<T>& plan,
                                size_t n_threads = 1);

// Upper bound on workers: hardware_concurrency(), or 1 when it is unknown.
size_t max_thread_count();

// Worker count actually used for K segments. 0 and requests above
// max_thread_count() both resolve to max_thread_count(); never more than K.
size_t resolve_thread_count(size_t requested, size_t n_segments);

} // namespace welch
