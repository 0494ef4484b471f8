/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/seed.hpp"

#include <boost/endian/conversion.hpp>

#include "crypto/sha/sha256.hpp"

namespace beacon {

  Epoch seedMixEpoch(Epoch epoch, const ChainConfig &config) {
    auto length = config.epochs_per_historical_vector;
    // Same as `(epoch + length - lookahead - 1) mod length` without overflow
    return (epoch % length + length - config.min_seed_lookahead - 1) % length;
  }

  Seed computeSeed(const RandaoMixes &mixes,
                   Epoch epoch,
                   const DomainType &domain,
                   const ChainConfig &config) {
    auto &mix = mixes.get(seedMixEpoch(epoch, config));
    qtils::ByteArr<sizeof(Epoch)> epoch_bytes;
    boost::endian::store_little_u64(epoch_bytes.data(), epoch);
    return crypto::sha256({domain, epoch_bytes, mix});
  }

}  // namespace beacon
