/**
 * @file test_id_sequence.cc
 * @brief Unit tests for IDSequence and its equivalence with IDIterator
 */

#include <gtest/gtest.h>

#include <vector>

#include "IDIterator.hpp"
#include "IDSequence.hpp"
#include "IDUtil.hpp"
#include "InvalidInputError.hpp"

TEST(IDSequenceTest, RangeForYieldsValidIds) {
  IDSequence sequence(100000000);
  std::vector<int64_t> ids;
  for (int64_t id : sequence) {
    ids.push_back(id);
    if (ids.size() == 3) break;
  }
  std::vector<int64_t> expected = {100000009, 100000017, 100000025};
  EXPECT_EQ(expected, ids);
}

TEST(IDSequenceTest, TakeStopsAtCount) {
  IDSequence sequence(500000000);
  std::vector<int64_t> ids = sequence.Take(25);
  ASSERT_EQ(25u, ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    EXPECT_TRUE(IDUtil::IsValid(ids[i]));
    if (i > 0) EXPECT_LT(ids[i - 1], ids[i]);
  }
}

TEST(IDSequenceTest, PullsResumeWhereTheyStopped) {
  IDSequence sequence(100000000);
  std::vector<int64_t> first = sequence.Take(2);
  std::vector<int64_t> second = sequence.Take(2);
  std::vector<int64_t> expected_first = {100000009, 100000017};
  std::vector<int64_t> expected_second = {100000025, 100000033};
  EXPECT_EQ(expected_first, first);
  EXPECT_EQ(expected_second, second);
}

TEST(IDSequenceTest, FiniteAtUpperBound) {
  IDSequence sequence(999999900);
  std::vector<int64_t> ids;
  for (int64_t id : sequence) {
    ids.push_back(id);
  }
  ASSERT_FALSE(ids.empty());
  EXPECT_EQ(999999998, ids.back());
  EXPECT_TRUE(sequence.Take(10).empty());
}

TEST(IDSequenceTest, EmptyWhenStartedAtUpperBound) {
  IDSequence sequence(999999999);
  EXPECT_TRUE(sequence.begin() == sequence.end());
}

TEST(IDSequenceTest, IteratorReachesEnd) {
  IDSequence sequence(999999990);
  IDSequence::const_iterator it = sequence.begin();
  ASSERT_TRUE(it != sequence.end());
  EXPECT_EQ(999999998, *it);
  ++it;
  EXPECT_TRUE(it == sequence.end());
}

TEST(IDSequenceTest, RejectsOutOfDomainStart) {
  EXPECT_THROW(IDSequence(12345678), InvalidInputError);
  EXPECT_THROW(IDSequence(1000000000), InvalidInputError);
}

// ============================================================================
// Iterator / sequence equivalence
// ============================================================================

class TraversalEquivalenceTest : public ::testing::TestWithParam<int64_t> {};

TEST_P(TraversalEquivalenceTest, SameIdsForSameStart) {
  const size_t count = 50;

  IDIterator iterator(GetParam());
  std::vector<int64_t> from_iterator;
  int64_t id;
  while (from_iterator.size() < count && iterator.Advance(&id)) {
    from_iterator.push_back(id);
  }

  IDSequence sequence(GetParam());
  std::vector<int64_t> from_sequence;
  for (int64_t value : sequence) {
    from_sequence.push_back(value);
    if (from_sequence.size() == count) break;
  }

  EXPECT_EQ(from_iterator, from_sequence);
  EXPECT_EQ(from_iterator, IDSequence(GetParam()).Take(count));
}

INSTANTIATE_TEST_SUITE_P(
  Starts, TraversalEquivalenceTest,
  ::testing::Values(100000000, 123456782, 314159265, 999999950, 999999999));
