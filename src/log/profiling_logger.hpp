/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string_view>

#include "log/logger.hpp"

namespace beacon::log {

  /**
   * Reports how long a scope took when it ends, or earlier on `end()`.
   */
  struct ProfileScope {
    using Clock = std::chrono::steady_clock;

    ProfileScope(std::string_view scope, Logger logger)
        : scope{scope}, logger{std::move(logger)}, start{Clock::now()} {}

    ProfileScope(ProfileScope &&) = delete;
    ProfileScope(const ProfileScope &) = delete;
    ProfileScope &operator=(const ProfileScope &) = delete;
    ProfileScope &operator=(ProfileScope &&) = delete;

    ~ProfileScope() {
      if (not done) {
        end();
      }
    }

    std::chrono::milliseconds elapsed() const {
      return std::chrono::duration_cast<std::chrono::milliseconds>(
          Clock::now() - start);
    }

    void end() {
      done = true;
      SL_INFO(logger, "{} took {} ms", scope, elapsed().count());
    }

   private:
    bool done = false;
    std::string_view scope;
    Logger logger;
    Clock::time_point start;
  };
}  // namespace beacon::log
