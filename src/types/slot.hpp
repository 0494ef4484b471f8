/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/outcome.hpp>

#include "types/chain_config.hpp"
#include "utils/checked_math.hpp"

namespace beacon {
  using Slot = uint64_t;
  using Epoch = uint64_t;

  /**
   * Epoch the slot belongs to.
   */
  inline Epoch epochFromSlot(Slot slot, const ChainConfig &config) {
    return slot / config.slots_per_epoch;
  }

  /**
   * First slot of the epoch.
   * Fails if the slot number does not fit into 64 bits.
   */
  inline outcome::result<Slot> firstSlotOfEpoch(Epoch epoch,
                                                const ChainConfig &config) {
    return checkedMul(epoch, config.slots_per_epoch);
  }
}  // namespace beacon
