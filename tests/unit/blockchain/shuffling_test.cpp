/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/shuffling.hpp"

#include <algorithm>
#include <numeric>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "testutil/literals.hpp"

using beacon::Seed;
using beacon::ShufflingError;
using beacon::ValidatorIndices;
using testing::ElementsAre;

namespace {
  ValidatorIndices iota(uint64_t count) {
    ValidatorIndices indices(count);
    std::iota(indices.begin(), indices.end(), 0);
    return indices;
  }

  /// `out[i] = in[computeShuffledIndex(i)]`, one index at a time
  ValidatorIndices shuffleByIndex(const ValidatorIndices &input,
                                  const Seed &seed,
                                  uint64_t rounds) {
    ValidatorIndices output;
    output.reserve(input.size());
    for (uint64_t i = 0; i < input.size(); ++i) {
      auto shuffled =
          beacon::computeShuffledIndex(i, input.size(), seed, rounds);
      EXPECT_TRUE(shuffled.has_value());
      output.push_back(input[shuffled.value()]);
    }
    return output;
  }
}  // namespace

TEST(ShufflingTest, KnownPermutation) {
  auto seed = "seed"_arr32;
  auto indices = iota(10);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(indices, seed, 10));
  EXPECT_THAT(indices, ElementsAre(9, 5, 6, 3, 7, 8, 1, 4, 0, 2));

  indices = iota(10);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(indices, seed, 90));
  EXPECT_THAT(indices, ElementsAre(0, 6, 8, 3, 1, 4, 5, 9, 2, 7));
}

TEST(ShufflingTest, SingleIndexKnownValues) {
  auto seed = "seed"_arr32;
  ValidatorIndices expected{9, 5, 6, 3, 7, 8, 1, 4, 0, 2};
  for (uint64_t i = 0; i < expected.size(); ++i) {
    ASSERT_OUTCOME_SUCCESS(shuffled,
                           beacon::computeShuffledIndex(i, 10, seed, 10));
    EXPECT_EQ(shuffled, expected[i]) << "index " << i;
  }
}

/**
 * @given lists of several sizes and seeds
 * @when shuffling whole list and shuffling index by index
 * @then both give the same permutation
 */
TEST(ShufflingTest, BulkMatchesSingleIndex) {
  for (auto count : {1, 2, 3, 16, 255, 256, 257, 10'000}) {
    for (auto &seed : {"alpha"_arr32, "beta"_arr32, Seed{}}) {
      auto rounds = count > 1'000 ? 10 : 90;
      auto bulk = iota(count);
      EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(bulk, seed, rounds));
      EXPECT_EQ(bulk, shuffleByIndex(iota(count), seed, rounds))
          << "count " << count;
    }
  }
}

TEST(ShufflingTest, MainnetRoundsOnLargeList) {
  auto seed = "mainnet"_arr32;
  auto bulk = iota(10'000);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(bulk, seed, 90));
  EXPECT_EQ(bulk, shuffleByIndex(iota(10'000), seed, 90));
}

TEST(ShufflingTest, IsPermutation) {
  auto indices = iota(1'000);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(indices, "perm"_arr32, 90));
  EXPECT_NE(indices, iota(1'000));
  std::ranges::sort(indices);
  EXPECT_EQ(indices, iota(1'000));
}

TEST(ShufflingTest, ShufflesValuesNotPositions) {
  ValidatorIndices values{100, 200, 300, 400, 500, 600, 700, 800, 900, 1000};
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(values, "seed"_arr32, 10));
  EXPECT_THAT(values,
              ElementsAre(1000, 600, 700, 400, 800, 900, 200, 500, 100, 300));
}

TEST(ShufflingTest, ZeroRoundsIsIdentity) {
  auto indices = iota(33);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(indices, "seed"_arr32, 0));
  EXPECT_EQ(indices, iota(33));
  ASSERT_OUTCOME_SUCCESS(index,
                         beacon::computeShuffledIndex(7, 33, "seed"_arr32, 0));
  EXPECT_EQ(index, 7);
}

TEST(ShufflingTest, Deterministic) {
  auto first = iota(500);
  auto second = iota(500);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(first, "same"_arr32, 90));
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(second, "same"_arr32, 90));
  EXPECT_EQ(first, second);

  auto other = iota(500);
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(other, "other"_arr32, 90));
  EXPECT_NE(first, other);
}

TEST(ShufflingTest, SingleElement) {
  ValidatorIndices indices{42};
  EXPECT_OUTCOME_SUCCESS(beacon::shuffleList(indices, "seed"_arr32, 90));
  EXPECT_THAT(indices, ElementsAre(42));
}

TEST(ShufflingTest, RejectsEmptyList) {
  ValidatorIndices empty;
  auto bulk = beacon::shuffleList(empty, "seed"_arr32, 90);
  ASSERT_TRUE(bulk.has_error());
  EXPECT_EQ(bulk.error(), ShufflingError::EMPTY_LIST);

  auto single = beacon::computeShuffledIndex(0, 0, "seed"_arr32, 90);
  ASSERT_TRUE(single.has_error());
  EXPECT_EQ(single.error(), ShufflingError::EMPTY_LIST);
}

TEST(ShufflingTest, RejectsIndexOutOfRange) {
  auto res = beacon::computeShuffledIndex(10, 10, "seed"_arr32, 90);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), ShufflingError::INDEX_OUT_OF_RANGE);
}

TEST(ShufflingTest, RejectsTooManyRounds) {
  auto indices = iota(10);
  auto bulk = beacon::shuffleList(indices, "seed"_arr32, 257);
  ASSERT_TRUE(bulk.has_error());
  EXPECT_EQ(bulk.error(), ShufflingError::TOO_MANY_ROUNDS);
  EXPECT_EQ(indices, iota(10));

  EXPECT_OUTCOME_ERROR(beacon::computeShuffledIndex(0, 10, "seed"_arr32, 257));
  EXPECT_OUTCOME_SUCCESS(
      beacon::computeShuffledIndex(0, 10, "seed"_arr32, 256));
}
