/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/committee.hpp"

namespace beacon::verification {
  /**
   * Reference committees the computed ones are checked against.
   */
  class CommitteeSource {
   public:
    virtual ~CommitteeSource() = default;

    /**
     * Committees of every slot of `epoch`, ordered by slot and then index.
     */
    [[nodiscard]] virtual outcome::result<Committees> committeesForEpoch(
        Epoch epoch) const = 0;
  };
}  // namespace beacon::verification
