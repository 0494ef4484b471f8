/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verification/election_verifier.hpp"

#include <algorithm>
#include <map>
#include <tuple>

#include "blockchain/active_validators.hpp"
#include "blockchain/committees.hpp"
#include "blockchain/seed.hpp"
#include "log/profiling_logger.hpp"

namespace beacon::verification {
  namespace {
    using CommitteeKey = std::pair<Slot, CommitteeIndex>;

    ValidatorIndices concatenate(const Committees &committees) {
      ValidatorIndices all;
      for (auto &committee : committees) {
        all.insert(all.end(),
                   committee.validators.begin(),
                   committee.validators.end());
      }
      return all;
    }

    std::optional<uint64_t> firstDifference(const ValidatorIndices &l,
                                            const ValidatorIndices &r) {
      auto [l_it, r_it] = std::ranges::mismatch(l, r);
      if (l_it == l.end() and r_it == r.end()) {
        return std::nullopt;
      }
      return static_cast<uint64_t>(l_it - l.begin());
    }
  }  // namespace

  EpochReport compareCommittees(Epoch epoch,
                                const Committees &computed,
                                const Committees &expected) {
    EpochReport report{
        .epoch = epoch,
        .committee_count = computed.size(),
    };

    std::map<CommitteeKey, const Committee *> reference;
    for (auto &committee : expected) {
      reference.emplace(CommitteeKey{committee.slot, committee.index},
                        &committee);
    }

    std::vector<const Committee *> expected_ordered;
    for (auto &committee : computed) {
      report.validator_count += committee.validators.size();
      auto it = reference.find({committee.slot, committee.index});
      if (it == reference.end()) {
        report.mismatches.push_back({
            .slot = committee.slot,
            .index = committee.index,
            .computed = committee.validators,
        });
        continue;
      }
      if (it->second->validators != committee.validators) {
        report.mismatches.push_back({
            .slot = committee.slot,
            .index = committee.index,
            .expected = it->second->validators,
            .computed = committee.validators,
        });
      }
      reference.erase(it);
    }
    // Left in `reference` are committees nothing was computed for
    for (auto &[key, committee] : reference) {
      report.mismatches.push_back({
          .slot = key.first,
          .index = key.second,
          .expected = committee->validators,
      });
    }

    auto sorted_expected = expected;
    std::ranges::sort(sorted_expected,
                      [](const Committee &l, const Committee &r) {
                        return std::tie(l.slot, l.index)
                             < std::tie(r.slot, r.index);
                      });
    report.first_difference =
        firstDifference(concatenate(computed), concatenate(sorted_expected));
    report.passed =
        report.mismatches.empty() and not report.first_difference.has_value();
    return report;
  }

  ElectionVerifier::ElectionVerifier(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<CommitteeSource> source,
      ChainConfig config,
      size_t threads)
      : logger_{logsys->getLogger("ElectionVerifier", "election")},
        profiling_logger_{logsys->getLogger("Profiling", "profiling")},
        source_{std::move(source)},
        config_{config},
        threads_{threads} {}

  outcome::result<EpochReport> ElectionVerifier::verifyEpoch(
      const LightState &state, Epoch epoch) const {
    Committees expected;
    {
      log::ProfileScope scope{"Loading reference committees",
                              profiling_logger_};
      OUTCOME_TRY(committees, source_->committeesForEpoch(epoch));
      expected = std::move(committees);
    }

    ValidatorIndices active_indices;
    {
      log::ProfileScope scope{"Computing active validators",
                              profiling_logger_};
      active_indices = getActiveValidatorIndices(state.validators, epoch);
    }
    SL_VERBOSE(logger_,
               "{} of {} validators active in epoch {}",
               active_indices.size(),
               state.validators.size(),
               epoch);

    auto seed =
        computeSeed(state.randao_mixes, epoch, DOMAIN_BEACON_ATTESTER, config_);
    log::ProfileScope shuffle_scope{"Shuffling", profiling_logger_};
    OUTCOME_TRY(shuffling,
                EpochShuffling::compute(
                    std::move(active_indices), seed, epoch, config_));
    shuffle_scope.end();

    SL_INFO(logger_,
            "Computing all {} committees of epoch {}",
            shuffling.committeeCount(),
            epoch);
    Committees computed;
    {
      log::ProfileScope scope{"Committees computation", profiling_logger_};
      computed = computeEpochCommittees(shuffling, threads_);
    }

    auto report = compareCommittees(epoch, computed, expected);
    if (report.passed) {
      SL_INFO(logger_, "Election passed for epoch {}", epoch);
    } else {
      SL_WARN(logger_,
              "Election failed for epoch {}: {} of {} committees differ",
              epoch,
              report.mismatches.size(),
              report.committee_count);
      for (auto &mismatch : report.mismatches) {
        SL_DEBUG(logger_,
                 "Committee {} at slot {}: {} expected, {} computed members",
                 mismatch.index,
                 mismatch.slot,
                 mismatch.expected.size(),
                 mismatch.computed.size());
      }
    }
    return report;
  }

  outcome::result<std::vector<EpochReport>> ElectionVerifier::runElections(
      const LightState &state, Epoch start, Epoch end) const {
    std::vector<EpochReport> reports;
    for (auto epoch = start; epoch <= end; ++epoch) {
      SL_INFO(logger_,
              "Election for epoch {}/{} ({} remaining)",
              epoch,
              end,
              end - epoch);
      OUTCOME_TRY(report, verifyEpoch(state, epoch));
      reports.emplace_back(std::move(report));
      if (epoch == end) {
        break;
      }
    }
    return reports;
  }

}  // namespace beacon::verification
