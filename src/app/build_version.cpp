/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef BEACON_VERSION
#define BEACON_VERSION "undefined"
#endif

namespace beacon {
  const std::string &buildVersion() {
    static const std::string version{BEACON_VERSION};
    return version;
  }
}  // namespace beacon
