/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/active_validators.hpp"

namespace beacon {

  ValidatorIndices getActiveValidatorIndices(const Validators &validators,
                                             Epoch epoch) {
    ValidatorIndices indices;
    indices.reserve(validators.size());
    for (ValidatorIndex i = 0; i < validators.size(); ++i) {
      if (isActiveValidator(validators[i], epoch)) {
        indices.push_back(i);
      }
    }
    return indices;
  }

}  // namespace beacon
