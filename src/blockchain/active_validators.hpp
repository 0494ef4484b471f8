/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/validator.hpp"
#include "types/validator_index.hpp"

namespace beacon {
  /**
   * Whether the validator is active at `epoch`:
   * `activation_epoch <= epoch < exit_epoch`.
   */
  inline bool isActiveValidator(const Validator &validator, Epoch epoch) {
    return validator.activation_epoch <= epoch
       and epoch < validator.exit_epoch;
  }

  /**
   * Indices of validators active at `epoch`, in registry order.
   */
  ValidatorIndices getActiveValidatorIndices(const Validators &validators,
                                             Epoch epoch);
}  // namespace beacon
