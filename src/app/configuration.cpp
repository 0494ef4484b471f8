/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace beacon::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        epoch_start_(0),
        epoch_catchup_(0),
        threads_(1),
        chain_(ChainConfig::mainnet()) {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::string &Configuration::name() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const std::filesystem::path &Configuration::validatorsFile() const {
    return validators_file_;
  }

  const std::filesystem::path &Configuration::committeesPath() const {
    return committees_path_;
  }

  const std::vector<std::filesystem::path> &Configuration::blockFiles() const {
    return block_files_;
  }

  const std::optional<std::string> &Configuration::randaoMixHex() const {
    return randao_mix_hex_;
  }

  Epoch Configuration::epochStart() const {
    return epoch_start_;
  }

  Epoch Configuration::epochCatchup() const {
    return epoch_catchup_;
  }

  size_t Configuration::threads() const {
    return threads_;
  }

  const ChainConfig &Configuration::chain() const {
    return chain_;
  }

}  // namespace beacon::app
