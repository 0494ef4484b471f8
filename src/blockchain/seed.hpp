/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/randao_mixes.hpp"
#include "types/chain_config.hpp"
#include "types/constants.hpp"

namespace beacon {
  using Seed = Hash256;

  /**
   * Epoch whose RANDAO mix keys the seed of `epoch`, i.e.
   * `epoch - MIN_SEED_LOOKAHEAD - 1` taken modulo the ring length.
   */
  Epoch seedMixEpoch(Epoch epoch, const ChainConfig &config);

  /**
   * Seed of `epoch` for `domain`:
   * `sha256(domain ‖ uint64_le(epoch) ‖ mix)`.
   */
  Seed computeSeed(const RandaoMixes &mixes,
                   Epoch epoch,
                   const DomainType &domain,
                   const ChainConfig &config);
}  // namespace beacon
