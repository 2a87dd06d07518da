#ifndef IDCHECK_ID_SEQUENCE_H_
#define IDCHECK_ID_SEQUENCE_H_

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "IDIterator.hpp"

// Lazy, finite sequence of valid ids starting at the supplied id. Values are
// produced on demand by pulling from an IDIterator owned by the sequence, so
// a sequence can only be walked once; build a new one to start over.
//
//   for (int64_t id : IDSequence(100000000)) { ... }
class IDSequence {
 public:
  // Single pass input iterator. A default constructed iterator is the end
  // marker.
  class const_iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = int64_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const int64_t*;
    using reference = const int64_t&;

    const_iterator() : source_(nullptr), current_(0) {}

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    const_iterator& operator++() {
      Pull();
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator previous = *this;
      Pull();
      return previous;
    }

    // All iterators over the same sequence compare equal until the sequence
    // is exhausted, at which point they become equal to end().
    bool operator==(const const_iterator& other) const {
      return source_ == other.source_;
    }

    bool operator!=(const const_iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class IDSequence;

    explicit const_iterator(IDIterator* source) : source_(source), current_(0) {
      Pull();
    }

    void Pull() {
      if (source_ != nullptr && !source_->Advance(&current_)) {
        source_ = nullptr;
      }
    }

    IDIterator* source_;
    int64_t current_;
  };

  explicit IDSequence(int64_t start) : source_(start) {}

  // Iterators hold a pointer into the sequence.
  IDSequence(const IDSequence&) = delete;
  IDSequence& operator=(const IDSequence&) = delete;

  const_iterator begin() {
    return const_iterator(&source_);
  }

  const_iterator end() {
    return const_iterator();
  }

  // Pulls at most count ids from the sequence.
  std::vector<int64_t> Take(size_t count) {
    std::vector<int64_t> ids;
    ids.reserve(count);
    int64_t id;
    while (ids.size() < count && source_.Advance(&id)) {
      ids.push_back(id);
    }
    return ids;
  }

 private:
  IDIterator source_;
};

#endif  // IDCHECK_ID_SEQUENCE_H_
