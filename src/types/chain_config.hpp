/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace beacon {

  /**
   * Chain constants the shuffling depends on.
   * Passed explicitly, so several networks can coexist in one process.
   */
  struct ChainConfig {
    enum class Error {
      ZERO_VALUE = 1,
      TOO_MANY_SHUFFLE_ROUNDS,
      SEED_LOOKAHEAD_TOO_LARGE,
      UNKNOWN_PRESET,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::ZERO_VALUE:
          return "Chain config value must be positive";
        case E::TOO_MANY_SHUFFLE_ROUNDS:
          return "Shuffle round count does not fit into one byte";
        case E::SEED_LOOKAHEAD_TOO_LARGE:
          return "Seed lookahead must be smaller than the RANDAO vector";
        case E::UNKNOWN_PRESET:
          return "Unknown chain config preset";
      }
      return "Unknown ChainConfig::Error";
    }

    uint64_t slots_per_epoch;
    uint64_t target_committee_size;
    uint64_t max_committees_per_slot;
    uint64_t epochs_per_historical_vector;
    uint64_t min_seed_lookahead;
    uint64_t shuffle_round_count;

    bool operator==(const ChainConfig &) const = default;

    static ChainConfig mainnet();
    static ChainConfig minimal();
    static outcome::result<ChainConfig> preset(std::string_view name);

    outcome::result<void> validate() const;
  };

}  // namespace beacon
