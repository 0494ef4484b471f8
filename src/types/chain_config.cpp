/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/chain_config.hpp"

#include "types/constants.hpp"

namespace beacon {

  ChainConfig ChainConfig::mainnet() {
    return ChainConfig{
        .slots_per_epoch = 32,
        .target_committee_size = 128,
        .max_committees_per_slot = 64,
        .epochs_per_historical_vector = 1 << 16,
        .min_seed_lookahead = 1,
        .shuffle_round_count = 90,
    };
  }

  ChainConfig ChainConfig::minimal() {
    return ChainConfig{
        .slots_per_epoch = 8,
        .target_committee_size = 4,
        .max_committees_per_slot = 4,
        .epochs_per_historical_vector = 64,
        .min_seed_lookahead = 1,
        .shuffle_round_count = 10,
    };
  }

  outcome::result<ChainConfig> ChainConfig::preset(std::string_view name) {
    if (name == "mainnet") {
      return mainnet();
    }
    if (name == "minimal") {
      return minimal();
    }
    return Error::UNKNOWN_PRESET;
  }

  outcome::result<void> ChainConfig::validate() const {
    if (slots_per_epoch == 0 or target_committee_size == 0
        or max_committees_per_slot == 0 or epochs_per_historical_vector == 0
        or shuffle_round_count == 0) {
      return Error::ZERO_VALUE;
    }
    if (shuffle_round_count > MAX_SHUFFLE_ROUND_COUNT) {
      return Error::TOO_MANY_SHUFFLE_ROUNDS;
    }
    if (min_seed_lookahead >= epochs_per_historical_vector) {
      return Error::SEED_LOOKAHEAD_TOO_LARGE;
    }
    return outcome::success();
  }

}  // namespace beacon
