/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace beacon::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1 };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"beacon"};

  class LoggingSystem {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    LoggingSystem(const LoggingSystem &) = delete;
    LoggingSystem &operator=(const LoggingSystem &) = delete;
    LoggingSystem(LoggingSystem &&) = delete;
    LoggingSystem &operator=(LoggingSystem &&) = delete;

    /**
     * Applies `-l` CLI filters: `<level>` for the default group,
     * `<group>=<level>` for a named one.
     */
    void tuneLoggingSystem(const std::vector<std::string> &cfg);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace beacon::log

OUTCOME_HPP_DECLARE_ERROR(beacon::log, Error);
