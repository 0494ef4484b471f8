/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/committees.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "blockchain/active_validators.hpp"
#include "blockchain/shuffling.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon, CommitteeError, e) {
  using E = beacon::CommitteeError;
  switch (e) {
    case E::NO_ACTIVE_VALIDATORS:
      return "No active validators in epoch";
    case E::SLOT_OUT_OF_EPOCH:
      return "Slot does not belong to the shuffled epoch";
    case E::COMMITTEE_INDEX_OUT_OF_RANGE:
      return "Committee index is out of range";
  }
  return "Unknown CommitteeError";
}

namespace beacon {

  uint64_t committeeCountPerSlot(uint64_t active_count,
                                 const ChainConfig &config) {
    auto count = active_count / config.slots_per_epoch
               / config.target_committee_size;
    return std::clamp<uint64_t>(count, 1, config.max_committees_per_slot);
  }

  std::span<const ValidatorIndex> computeCommittee(
      std::span<const ValidatorIndex> shuffled, uint64_t k, uint64_t count) {
    // floor(len * k / count) without forming `len * k`
    auto bound = [len = shuffled.size(), count](uint64_t i) {
      return len / count * i + len % count * i / count;
    };
    auto start = bound(k);
    auto end = bound(k + 1);
    return shuffled.subspan(start, end - start);
  }

  outcome::result<EpochShuffling> EpochShuffling::compute(
      const LightState &state, Epoch epoch, const ChainConfig &config) {
    auto seed =
        computeSeed(state.randao_mixes, epoch, DOMAIN_BEACON_ATTESTER, config);
    return compute(getActiveValidatorIndices(state.validators, epoch),
                   seed,
                   epoch,
                   config);
  }

  outcome::result<EpochShuffling> EpochShuffling::compute(
      ValidatorIndices active_indices,
      const Seed &seed,
      Epoch epoch,
      const ChainConfig &config) {
    if (active_indices.empty()) {
      return CommitteeError::NO_ACTIVE_VALIDATORS;
    }

    EpochShuffling shuffling;
    shuffling.epoch_ = epoch;
    shuffling.seed_ = seed;
    shuffling.slots_per_epoch_ = config.slots_per_epoch;
    OUTCOME_TRY(first_slot, firstSlotOfEpoch(epoch, config));
    shuffling.first_slot_ = first_slot;
    shuffling.committees_per_slot_ =
        committeeCountPerSlot(active_indices.size(), config);
    OUTCOME_TRY(committee_count,
                checkedMul(shuffling.committees_per_slot_,
                           config.slots_per_epoch));
    shuffling.committee_count_ = committee_count;

    OUTCOME_TRY(shuffleList(active_indices, seed, config.shuffle_round_count));
    shuffling.shuffled_ = std::move(active_indices);
    return shuffling;
  }

  outcome::result<std::span<const ValidatorIndex>> EpochShuffling::committee(
      Slot slot, CommitteeIndex index) const {
    if (slot < first_slot_ or slot - first_slot_ >= slots_per_epoch_) {
      return CommitteeError::SLOT_OUT_OF_EPOCH;
    }
    if (index >= committees_per_slot_) {
      return CommitteeError::COMMITTEE_INDEX_OUT_OF_RANGE;
    }
    auto k = (slot - first_slot_) * committees_per_slot_ + index;
    return computeCommittee(shuffled_, k, committee_count_);
  }

  outcome::result<ValidatorIndices> getBeaconCommittee(
      const LightState &state,
      Slot slot,
      CommitteeIndex index,
      const ChainConfig &config) {
    OUTCOME_TRY(shuffling,
                EpochShuffling::compute(
                    state, epochFromSlot(slot, config), config));
    OUTCOME_TRY(members, shuffling.committee(slot, index));
    return ValidatorIndices{members.begin(), members.end()};
  }

  Committees computeEpochCommittees(const EpochShuffling &shuffling,
                                    size_t threads) {
    Committees committees(shuffling.committeeCount());
    auto fill = [&shuffling, &committees](uint64_t k) {
      auto &committee = committees[k];
      committee.slot =
          shuffling.firstSlot() + k / shuffling.committeesPerSlot();
      committee.index = k % shuffling.committeesPerSlot();
      auto members = computeCommittee(
          shuffling.shuffledIndices(), k, shuffling.committeeCount());
      committee.validators.assign(members.begin(), members.end());
    };

    if (threads <= 1) {
      for (uint64_t k = 0; k < committees.size(); ++k) {
        fill(k);
      }
      return committees;
    }

    // Each task writes its own element only
    boost::asio::thread_pool pool{threads};
    for (uint64_t k = 0; k < committees.size(); ++k) {
      boost::asio::post(pool, [&fill, k] { fill(k); });
    }
    pool.join();
    return committees;
  }

}  // namespace beacon
