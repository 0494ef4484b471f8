/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "serde/json_fwd.hpp"
#include "types/slot.hpp"
#include "types/validator_index.hpp"

namespace beacon {
  /**
   * Members of the committee `index` at `slot`.
   */
  struct Committee {
    Slot slot = 0;
    CommitteeIndex index = 0;
    ValidatorIndices validators;

    bool operator==(const Committee &) const = default;

    JSON_FIELDS(index, slot, validators);
  };

  using Committees = std::vector<Committee>;
}  // namespace beacon
