/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/enum_error_code.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/chain_config.hpp"
#include "verification/committee_source.hpp"

namespace beacon::verification {
  enum class CommitteeSourceError : uint8_t {
    FILE_NOT_FOUND = 1,
    NO_COMMITTEES_FOR_EPOCH,
    FILE_ACCESS_FAILED,
  };

  /**
   * Reads committees responses saved from a beacon node.
   * `path` is either one response file, from which the committees of the
   * requested epoch are picked, or a directory with one `<epoch>.json`
   * response per epoch.
   */
  class FileCommitteeSource : public CommitteeSource {
   public:
    FileCommitteeSource(qtils::SharedRef<log::LoggingSystem> logsys,
                        std::filesystem::path path,
                        ChainConfig config);

    outcome::result<Committees> committeesForEpoch(
        Epoch epoch) const override;

   private:
    outcome::result<std::filesystem::path> fileForEpoch(Epoch epoch) const;

    log::Logger logger_;
    std::filesystem::path path_;
    ChainConfig config_;
  };
}  // namespace beacon::verification

OUTCOME_HPP_DECLARE_ERROR(beacon::verification, CommitteeSourceError);
