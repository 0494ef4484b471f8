/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/hash_types.hpp"
#include "types/slot.hpp"

namespace beacon {

  /**
   * Ring of historical RANDAO mixes, `EPOCHS_PER_HISTORICAL_VECTOR` long.
   * Epoch `e` lives in slot `e mod length`. Slots that were never written
   * hold the zero hash.
   */
  class RandaoMixes {
   public:
    explicit RandaoMixes(uint64_t length);

    uint64_t length() const {
      return mixes_.size();
    }

    const Hash256 &get(Epoch epoch) const;

    void set(Epoch epoch, const Hash256 &mix);

    bool operator==(const RandaoMixes &) const = default;

   private:
    std::vector<Hash256> mixes_;
  };

}  // namespace beacon
