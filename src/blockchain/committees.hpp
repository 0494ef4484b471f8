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
#include "types/chain_config.hpp"
#include "types/committee.hpp"
#include "types/light_state.hpp"

namespace beacon {
  enum class CommitteeError : uint8_t {
    NO_ACTIVE_VALIDATORS = 1,
    SLOT_OUT_OF_EPOCH,
    COMMITTEE_INDEX_OUT_OF_RANGE,
  };

  /**
   * Number of committees in each slot of an epoch with `active_count` active
   * validators, clamped to `[1, MAX_COMMITTEES_PER_SLOT]`.
   */
  uint64_t committeeCountPerSlot(uint64_t active_count,
                                 const ChainConfig &config);

  /**
   * Slice `k` of `count` of the shuffled list:
   * `[len * k / count, len * (k + 1) / count)`.
   * Slices are contiguous and their sizes differ by at most one.
   */
  std::span<const ValidatorIndex> computeCommittee(
      std::span<const ValidatorIndex> shuffled, uint64_t k, uint64_t count);

  /**
   * Attester shuffling of one epoch.
   * Holds the active indices permuted with the attester seed; committees are
   * views into it, so it must outlive them.
   */
  class EpochShuffling {
   public:
    /**
     * Filters active validators of `epoch` and shuffles them with
     * the attester seed taken from `state.randao_mixes`.
     */
    static outcome::result<EpochShuffling> compute(const LightState &state,
                                                   Epoch epoch,
                                                   const ChainConfig &config);

    /**
     * Shuffles precomputed active indices of `epoch` with `seed`.
     */
    static outcome::result<EpochShuffling> compute(
        ValidatorIndices active_indices,
        const Seed &seed,
        Epoch epoch,
        const ChainConfig &config);

    Epoch epoch() const {
      return epoch_;
    }

    const Seed &seed() const {
      return seed_;
    }

    Slot firstSlot() const {
      return first_slot_;
    }

    uint64_t slotsPerEpoch() const {
      return slots_per_epoch_;
    }

    uint64_t committeesPerSlot() const {
      return committees_per_slot_;
    }

    /// Committees in the whole epoch
    uint64_t committeeCount() const {
      return committee_count_;
    }

    const ValidatorIndices &shuffledIndices() const {
      return shuffled_;
    }

    /**
     * Members of committee `index` at `slot`.
     * Committee `k = (slot - firstSlot()) * committeesPerSlot() + index`
     * of `committeeCount()`.
     */
    outcome::result<std::span<const ValidatorIndex>> committee(
        Slot slot, CommitteeIndex index) const;

   private:
    EpochShuffling() = default;

    Epoch epoch_ = 0;
    Seed seed_;
    Slot first_slot_ = 0;
    uint64_t slots_per_epoch_ = 0;
    uint64_t committees_per_slot_ = 0;
    uint64_t committee_count_ = 0;
    ValidatorIndices shuffled_;
  };

  /**
   * Members of committee `index` at `slot`, recomputing the shuffling of the
   * slot's epoch from `state`.
   */
  outcome::result<ValidatorIndices> getBeaconCommittee(
      const LightState &state,
      Slot slot,
      CommitteeIndex index,
      const ChainConfig &config);

  /**
   * All committees of the epoch, ordered by slot and then committee index.
   * With `threads > 1` committees are sliced on a thread pool; the shuffling
   * is only read.
   */
  Committees computeEpochCommittees(const EpochShuffling &shuffling,
                                    size_t threads = 1);
}  // namespace beacon

OUTCOME_HPP_DECLARE_ERROR(beacon, CommitteeError);
