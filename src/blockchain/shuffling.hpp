/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "blockchain/seed.hpp"
#include "types/validator_index.hpp"

namespace beacon {
  enum class ShufflingError : uint8_t {
    EMPTY_LIST = 1,
    INDEX_OUT_OF_RANGE,
    TOO_MANY_ROUNDS,
  };

  /**
   * Swap-or-not shuffle of a single index.
   * Runs rounds `0 .. round_count-1`; for fixed `index_count` and `seed` the
   * result is a bijection over `[0, index_count)`.
   * @param index position to shuffle, must be below `index_count`
   * @param index_count size of the shuffled list, must be positive
   * @param seed shuffling seed
   * @param round_count number of rounds, at most 256
   * @return position `index` is moved to
   */
  outcome::result<uint64_t> computeShuffledIndex(uint64_t index,
                                                 uint64_t index_count,
                                                 const Seed &seed,
                                                 uint64_t round_count);

  /**
   * Swap-or-not shuffle of a whole list in place.
   * Runs the rounds in descending order so that afterwards
   * `indices[i] == input[computeShuffledIndex(i, size, seed, rounds)]`.
   * Each source hash covers 256 positions and is computed once per block.
   *
   * Takes exclusive write access to `indices` until it returns.
   */
  outcome::result<void> shuffleList(std::span<ValidatorIndex> indices,
                                    const Seed &seed,
                                    uint64_t round_count);
}  // namespace beacon

OUTCOME_HPP_DECLARE_ERROR(beacon, ShufflingError);
