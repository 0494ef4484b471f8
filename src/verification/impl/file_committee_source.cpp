/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verification/impl/file_committee_source.hpp"

#include <algorithm>
#include <system_error>
#include <tuple>

#include <fmt/format.h>
#include <qtils/read_file.hpp>

#include "serde/beacon_api.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon::verification, CommitteeSourceError, e) {
  using E = beacon::verification::CommitteeSourceError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "Committees file not found";
    case E::NO_COMMITTEES_FOR_EPOCH:
      return "Committees file has no committee of the epoch";
    case E::FILE_ACCESS_FAILED:
      return "Committees path is not accessible";
  }
  return "Unknown CommitteeSourceError";
}

namespace beacon::verification {
  namespace {
    // Type of the file at `path`; `not_found` is not an error
    outcome::result<std::filesystem::file_type> fileType(
        const std::filesystem::path &path) {
      std::error_code ec;
      auto status = std::filesystem::status(path, ec);
      if (status.type() == std::filesystem::file_type::not_found) {
        return std::filesystem::file_type::not_found;
      }
      if (ec) {
        return CommitteeSourceError::FILE_ACCESS_FAILED;
      }
      return status.type();
    }
  }  // namespace

  FileCommitteeSource::FileCommitteeSource(
      qtils::SharedRef<log::LoggingSystem> logsys,
      std::filesystem::path path,
      ChainConfig config)
      : logger_{logsys->getLogger("CommitteeSource", "loader")},
        path_{std::move(path)},
        config_{config} {}

  outcome::result<std::filesystem::path> FileCommitteeSource::fileForEpoch(
      Epoch epoch) const {
    auto type = fileType(path_);
    if (type.has_error()) {
      SL_ERROR(logger_, "Can't access committees path {}", path_.string());
      return type.error();
    }
    if (type.value() == std::filesystem::file_type::directory) {
      return path_ / fmt::format("{}.json", epoch);
    }
    return path_;
  }

  outcome::result<Committees> FileCommitteeSource::committeesForEpoch(
      Epoch epoch) const {
    OUTCOME_TRY(file, fileForEpoch(epoch));
    OUTCOME_TRY(type, fileType(file));
    if (type == std::filesystem::file_type::not_found) {
      SL_ERROR(logger_, "No committees file {}", file.string());
      return CommitteeSourceError::FILE_NOT_FOUND;
    }
    OUTCOME_TRY(text, qtils::readText(file));
    auto decoded = serde::decodeCommittees(text);
    if (decoded.has_error()) {
      SL_ERROR(logger_,
               "Can't decode committees file {}: {}",
               file.string(),
               decoded.error());
      return decoded.error();
    }

    Committees committees;
    for (auto &committee : decoded.value()) {
      if (epochFromSlot(committee.slot, config_) == epoch) {
        committees.emplace_back(std::move(committee));
      }
    }
    if (committees.empty()) {
      return CommitteeSourceError::NO_COMMITTEES_FOR_EPOCH;
    }
    std::ranges::sort(committees, [](const Committee &l, const Committee &r) {
      return std::tie(l.slot, l.index) < std::tie(r.slot, r.index);
    });
    SL_DEBUG(logger_,
             "{} committees of epoch {} read from {}",
             committees.size(),
             epoch,
             file.string());
    return committees;
  }

}  // namespace beacon::verification
