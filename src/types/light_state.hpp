/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/randao_mixes.hpp"
#include "types/slot.hpp"
#include "types/validator.hpp"

namespace beacon {
  /**
   * Part of the beacon state needed to compute shufflings.
   * Built once by `LightStateFactory` and read-only afterwards.
   */
  struct LightState {
    Slot slot = 0;
    Validators validators;
    RandaoMixes randao_mixes;
  };
}  // namespace beacon
