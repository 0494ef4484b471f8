/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <span>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/chain_config.hpp"
#include "types/light_block.hpp"
#include "types/light_state.hpp"

namespace beacon {
  enum class LightStateError : uint8_t {
    EMPTY_REGISTRY = 1,
    INVALID_ACTIVATION_RANGE,
    RANDAO_BEFORE_GENESIS,
  };

  /**
   * Builds the light state a run of elections starts from.
   *
   * RANDAO ring is filled from two kinds of input:
   *  - a block of epoch `B` carries in `prev_randao` the mix of epoch `B - 1`
   *    (as long as it is the first block of its epoch), which keys the seed of
   *    epoch `B + MIN_SEED_LOOKAHEAD`; of several blocks of one epoch only the
   *    one with the lowest slot is used;
   *  - an explicit mix is written where the seed of the starting epoch reads.
   * Everything else stays zero.
   */
  class LightStateFactory {
   public:
    LightStateFactory(qtils::SharedRef<log::LoggingSystem> logsys,
                      ChainConfig config);

    outcome::result<LightState> create(
        Slot slot,
        Validators validators,
        std::span<const LightBlock> blocks,
        const std::optional<Hash256> &start_mix) const;

   private:
    log::Logger logger_;
    ChainConfig config_;
  };
}  // namespace beacon

OUTCOME_HPP_DECLARE_ERROR(beacon, LightStateError);
