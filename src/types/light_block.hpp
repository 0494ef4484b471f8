/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hash_types.hpp"
#include "types/slot.hpp"
#include "types/validator_index.hpp"

namespace beacon {
  /**
   * The part of a beacon block needed to seed the RANDAO ring.
   */
  struct LightBlock {
    Slot slot = 0;
    uint64_t block_number = 0;
    Hash256 prev_randao;
    ValidatorIndex proposer_index = 0;

    bool operator==(const LightBlock &) const = default;
  };
}  // namespace beacon
