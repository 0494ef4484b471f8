/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <iostream>
#include <string_view>
#include <tuple>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>

OUTCOME_CPP_DEFINE_CATEGORY(beacon::log, Error, e) {
  using E = beacon::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
  }
  return "Unknown log::Error";
}

namespace beacon::log {
  namespace {
    // Accepted spellings of `-l` levels, short aliases included
    constexpr std::array<std::pair<std::string_view, Level>, 13> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  void LoggingSystem::tuneLoggingSystem(const std::vector<std::string> &cfg) {
    for (std::string_view filter : cfg) {
      auto eq = filter.find('=');
      if (eq == std::string_view::npos) {
        auto level = str2lvl(filter);
        if (level.has_error()) {
          fmt::println(std::cerr, "Invalid log level '{}'", filter);
          continue;
        }
        std::ignore =
            logging_system_->setLevelOfGroup(defaultGroupName, level.value());
        continue;
      }

      std::string group{filter.substr(0, eq)};
      auto level = str2lvl(filter.substr(eq + 1));
      if (not logging_system_->getGroup(group)) {
        fmt::println(std::cerr, "Unknown log group '{}'", group);
        continue;
      }
      if (level.has_error()) {
        fmt::println(std::cerr,
                     "Invalid log level '{}' for group '{}'",
                     filter.substr(eq + 1),
                     group);
        continue;
      }
      std::ignore = logging_system_->setLevelOfGroup(group, level.value());
    }
  }

}  // namespace beacon::log
