/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/chain_config.hpp"
#include "types/committee.hpp"
#include "types/light_state.hpp"
#include "verification/committee_source.hpp"

namespace beacon::verification {

  /**
   * Committee whose computed members differ from the reference.
   * Empty `expected` means the reference lacks it, empty `computed` means
   * only the reference has it.
   */
  struct CommitteeMismatch {
    Slot slot = 0;
    CommitteeIndex index = 0;
    ValidatorIndices expected;
    ValidatorIndices computed;

    bool operator==(const CommitteeMismatch &) const = default;
  };

  struct EpochReport {
    Epoch epoch = 0;
    bool passed = false;
    uint64_t committee_count = 0;
    uint64_t validator_count = 0;
    /// First position where the concatenated committees differ
    std::optional<uint64_t> first_difference;
    std::vector<CommitteeMismatch> mismatches;
  };

  /**
   * Compares the committees of one epoch, both in canonical order,
   * committee by committee and as concatenated sequences.
   */
  EpochReport compareCommittees(Epoch epoch,
                                const Committees &computed,
                                const Committees &expected);

  /**
   * Recomputes committees from a light state and checks them against the
   * reference source. A mismatch is a result, not an error; errors are
   * reserved for failures to compute or to read the reference.
   */
  class ElectionVerifier {
   public:
    ElectionVerifier(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<CommitteeSource> source,
                     ChainConfig config,
                     size_t threads);

    outcome::result<EpochReport> verifyEpoch(const LightState &state,
                                             Epoch epoch) const;

    /**
     * Verifies every epoch of `[start, end]` in order.
     */
    outcome::result<std::vector<EpochReport>> runElections(
        const LightState &state, Epoch start, Epoch end) const;

   private:
    log::Logger logger_;
    log::Logger profiling_logger_;
    qtils::SharedRef<CommitteeSource> source_;
    ChainConfig config_;
    size_t threads_;
  };

}  // namespace beacon::verification
