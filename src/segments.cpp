#include "welch/segments.hpp"

#include "welch/errors.hpp"

#include <string>

namespace welch {

std::size_t segment_count(std::size_t n_samples, std::size_t length, std::size_t overlap) {
  if (length == 0 || overlap >= length || length > n_samples) return 0;
  return (n_samples - overlap) / (length - overlap);
}

Segmenter::Segmenter(std::size_t n_samples, std::size_t length, std::size_t overlap)
    : n_samples_(n_samples), length_(length), overlap_(overlap) {
  if (length_ == 0) throw ConfigError("Segmenter: segment length must be > 0");
  if (length_ > n_samples_) {
    throw ConfigError("Segmenter: segment length (" + std::to_string(length_) +
                      ") exceeds signal length (" + std::to_string(n_samples_) + ")");
  }
  if (overlap_ >= length_) {
    throw ConfigError("Segmenter: overlap (" + std::to_string(overlap_) +
                      ") must be < segment length (" + std::to_string(length_) + ")");
  }
  count_ = segment_count(n_samples_, length_, overlap_);
  if (count_ == 0) throw InsufficientDataError("Segmenter: not enough samples for one segment");
}

} // namespace welch
