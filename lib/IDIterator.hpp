#ifndef IDCHECK_ID_ITERATOR_H_
#define IDCHECK_ID_ITERATOR_H_

#include <cstdint>

#include "IDUtil.hpp"

// Resumable forward search over the valid id space. Starting at the supplied
// id (inclusive), each call to Advance() yields the next valid id in
// increasing order until the upper bound of 999999999 is passed.
//
// Not thread safe: callers sharing one instance must serialize access.
class IDIterator {
 public:
  explicit IDIterator(int64_t start) : cursor_(start) {
    if (!IDUtil::InDomain(start)) {
      throw InvalidInputError(start);
    }
  }

  // Writes the next valid id to *id and returns true, or returns false once
  // no valid id is left. The output is left untouched in the latter case.
  bool Advance(int64_t* id) {
    while (cursor_ <= IDUtil::kMaxID) {
      int64_t candidate = cursor_++;
      if (IDUtil::IsValid(candidate)) {
        *id = candidate;
        return true;
      }
    }
    return false;
  }

  // Next candidate to be tested.
  int64_t Cursor() const {
    return cursor_;
  }

  // True once the cursor has moved beyond 999999999. This only reports the
  // cursor: after the last valid id is emitted it can still be false, and
  // only Advance() returning false signals the end of the sequence.
  bool CursorPastEnd() const {
    return cursor_ > IDUtil::kMaxID;
  }

 private:
  int64_t cursor_;
};

#endif  // IDCHECK_ID_ITERATOR_H_
