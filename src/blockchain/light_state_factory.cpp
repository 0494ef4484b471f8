/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/light_state_factory.hpp"

#include <map>

#include "blockchain/seed.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon, LightStateError, e) {
  using E = beacon::LightStateError;
  switch (e) {
    case E::EMPTY_REGISTRY:
      return "Validator registry is empty";
    case E::INVALID_ACTIVATION_RANGE:
      return "Validator exits before it is activated";
    case E::RANDAO_BEFORE_GENESIS:
      return "Block of the genesis epoch carries no previous epoch mix";
  }
  return "Unknown LightStateError";
}

namespace beacon {

  LightStateFactory::LightStateFactory(
      qtils::SharedRef<log::LoggingSystem> logsys, ChainConfig config)
      : logger_{logsys->getLogger("LightState", "loader")},
        config_{config} {}

  outcome::result<LightState> LightStateFactory::create(
      Slot slot,
      Validators validators,
      std::span<const LightBlock> blocks,
      const std::optional<Hash256> &start_mix) const {
    if (validators.empty()) {
      return LightStateError::EMPTY_REGISTRY;
    }
    for (ValidatorIndex i = 0; i < validators.size(); ++i) {
      auto &validator = validators[i];
      if (validator.activation_epoch > validator.exit_epoch) {
        SL_ERROR(logger_,
                 "Validator {} is activated at epoch {} after exit at {}",
                 i,
                 validator.activation_epoch,
                 validator.exit_epoch);
        return LightStateError::INVALID_ACTIVATION_RANGE;
      }
    }

    LightState state{
        .slot = slot,
        .validators = std::move(validators),
        .randao_mixes = RandaoMixes{config_.epochs_per_historical_vector},
    };

    // Earliest block of each epoch, whatever order the blocks come in
    std::map<Epoch, const LightBlock *> first_blocks;
    for (auto &block : blocks) {
      auto block_epoch = epochFromSlot(block.slot, config_);
      if (block_epoch == 0) {
        return LightStateError::RANDAO_BEFORE_GENESIS;
      }
      auto [it, inserted] = first_blocks.emplace(block_epoch, &block);
      if (not inserted and block.slot < it->second->slot) {
        SL_DEBUG(logger_,
                 "Block at slot {} supersedes block at slot {} of epoch {}",
                 block.slot,
                 it->second->slot,
                 block_epoch);
        it->second = &block;
      }
    }

    for (auto &[block_epoch, block] : first_blocks) {
      state.randao_mixes.set(block_epoch - 1, block->prev_randao);
      SL_DEBUG(logger_,
               "Mix of epoch {} taken from block {} at slot {}",
               block_epoch - 1,
               block->block_number,
               block->slot);
    }

    auto start_epoch = epochFromSlot(slot, config_);
    if (start_mix.has_value()) {
      auto mix_epoch = seedMixEpoch(start_epoch, config_);
      state.randao_mixes.set(mix_epoch, start_mix.value());
      SL_DEBUG(logger_,
               "Mix for seed of epoch {} stored at ring position {}",
               start_epoch,
               mix_epoch);
    }

    SL_INFO(logger_,
            "Light state at slot {} (epoch {}) with {} validators",
            slot,
            start_epoch,
            state.validators.size());
    return state;
  }

}  // namespace beacon
