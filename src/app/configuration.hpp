/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types/chain_config.hpp"
#include "types/slot.hpp"

namespace beacon::app {
  class Configuration {
   public:
    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::string &name() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;
    [[nodiscard]] virtual const std::filesystem::path &validatorsFile() const;
    /// Committees response file, or a directory of `<epoch>.json` files
    [[nodiscard]] virtual const std::filesystem::path &committeesPath() const;
    [[nodiscard]] virtual const std::vector<std::filesystem::path> &
    blockFiles() const;
    /// `0x`-prefixed RANDAO mix feeding the seed of the start epoch
    [[nodiscard]] virtual const std::optional<std::string> &randaoMixHex()
        const;
    [[nodiscard]] virtual Epoch epochStart() const;
    [[nodiscard]] virtual Epoch epochCatchup() const;
    [[nodiscard]] virtual size_t threads() const;

    [[nodiscard]] virtual const ChainConfig &chain() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;
    std::filesystem::path validators_file_;
    std::filesystem::path committees_path_;
    std::vector<std::filesystem::path> block_files_;
    std::optional<std::string> randao_mix_hex_;
    Epoch epoch_start_;
    Epoch epoch_catchup_;
    size_t threads_;

    ChainConfig chain_;
  };

}  // namespace beacon::app
