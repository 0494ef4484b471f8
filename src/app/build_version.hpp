/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace beacon {
  /**
   * Version string baked in by the build (`BEACON_VERSION`).
   */
  const std::string &buildVersion();
}  // namespace beacon
