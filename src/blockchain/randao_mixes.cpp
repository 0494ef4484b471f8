/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/randao_mixes.hpp"

#include <boost/assert.hpp>

namespace beacon {

  RandaoMixes::RandaoMixes(uint64_t length) : mixes_(length) {
    BOOST_ASSERT(length != 0);
  }

  const Hash256 &RandaoMixes::get(Epoch epoch) const {
    return mixes_[epoch % mixes_.size()];
  }

  void RandaoMixes::set(Epoch epoch, const Hash256 &mix) {
    mixes_[epoch % mixes_.size()] = mix;
  }

}  // namespace beacon
