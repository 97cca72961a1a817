#pragma once

#include <cstddef>
#include <iterator>

namespace welch {

// A simple half-open index segment: [start, end)
struct IndexSegment {
  std::size_t start{0};
  std::size_t end{0};

  std::size_t length() const { return (end > start) ? (end - start) : 0; }
};

inline bool operator==(const IndexSegment& a, const IndexSegment& b) {
  return a.start == b.start && a.end == b.end;
}

inline bool operator!=(const IndexSegment& a, const IndexSegment& b) {
  return !(a == b);
}

// Number of full segments of `length` samples, advancing by length - overlap,
// that fit in n_samples:
//   K = floor((n_samples - overlap) / (length - overlap))
// Returns 0 when length == 0, overlap >= length or length > n_samples.
std::size_t segment_count(std::size_t n_samples, std::size_t length, std::size_t overlap);

// Splits [0, n_samples) into K equal-length, possibly overlapping segments.
//
// Segment i is [i * hop, i * hop + length) with hop = length - overlap. The
// trailing remainder shorter than `length` is discarded, never zero-padded.
//
// The segmenter stores only the three sizes; iterating recomputes offsets, so
// it can be walked any number of times and always yields the same segments.
class Segmenter {
public:
  class const_iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = IndexSegment;
    using difference_type = std::ptrdiff_t;
    using pointer = const IndexSegment*;
    using reference = IndexSegment;

    const_iterator() = default;

    IndexSegment operator*() const { return owner_->segment(index_); }

    const_iterator& operator++() {
      ++index_;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++index_;
      return tmp;
    }

    bool operator==(const const_iterator& o) const { return index_ == o.index_; }
    bool operator!=(const const_iterator& o) const { return index_ != o.index_; }

  private:
    friend class Segmenter;
    const_iterator(const Segmenter* owner, std::size_t index) : owner_(owner), index_(index) {}

    const Segmenter* owner_{nullptr};
    std::size_t index_{0};
  };

  // Throws ConfigError if length == 0, length > n_samples or
  // overlap >= length.
  Segmenter(std::size_t n_samples, std::size_t length, std::size_t overlap);

  std::size_t n_samples() const { return n_samples_; }
  std::size_t length() const { return length_; }
  std::size_t overlap() const { return overlap_; }
  std::size_t hop() const { return length_ - overlap_; }
  std::size_t count() const { return count_; }

  // i must be < count().
  IndexSegment segment(std::size_t i) const {
    const std::size_t start = i * hop();
    return IndexSegment{start, start + length_};
  }

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, count_); }

private:
  std::size_t n_samples_{0};
  std::size_t length_{0};
  std::size_t overlap_{0};
  std::size_t count_{0};
};

} // namespace welch
