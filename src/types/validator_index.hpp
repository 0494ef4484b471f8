/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

namespace beacon {
  /// Position of a validator in the registry
  using ValidatorIndex = uint64_t;
  using ValidatorIndices = std::vector<ValidatorIndex>;

  /// Index of a committee within one slot
  using CommitteeIndex = uint64_t;
}  // namespace beacon
