/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/shuffling.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <boost/endian/conversion.hpp>

#include "crypto/sha/sha256.hpp"
#include "types/constants.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon, ShufflingError, e) {
  using E = beacon::ShufflingError;
  switch (e) {
    case E::EMPTY_LIST:
      return "Can't shuffle an empty list";
    case E::INDEX_OUT_OF_RANGE:
      return "Shuffled index is out of range";
    case E::TOO_MANY_ROUNDS:
      return "Shuffle round number does not fit into one byte";
  }
  return "Unknown ShufflingError";
}

namespace beacon {
  namespace {
    constexpr size_t kSeedSize = 32;
    static_assert(Seed{}.size() == kSeedSize);
    constexpr size_t kPivotInputSize = kSeedSize + 1;
    constexpr size_t kSourceInputSize = kPivotInputSize + sizeof(uint32_t);
    constexpr uint64_t kPositionsPerSource = 256;

    /**
     * Hash preimage `seed ‖ uint8(round) ‖ uint32_le(position / 256)`.
     * The pivot hash uses the first 33 bytes only.
     */
    class RoundInput {
     public:
      explicit RoundInput(const Seed &seed) {
        std::ranges::copy(seed, buffer_.begin());
      }

      void setRound(uint64_t round) {
        buffer_[kSeedSize] = static_cast<uint8_t>(round);
      }

      uint64_t pivot(uint64_t index_count) const {
        auto hash = crypto::sha256(
            qtils::ByteView{buffer_.data(), kPivotInputSize});
        return boost::endian::load_little_u64(hash.data()) % index_count;
      }

      Hash256 source(uint64_t position) {
        boost::endian::store_little_u32(
            buffer_.data() + kPivotInputSize,
            static_cast<uint32_t>(position / kPositionsPerSource));
        return crypto::sha256(qtils::ByteView{buffer_});
      }

     private:
      std::array<uint8_t, kSourceInputSize> buffer_{};
    };

    bool sourceBit(const Hash256 &source, uint64_t position) {
      auto bit = position % kPositionsPerSource;
      return ((source[bit / 8] >> (bit % 8)) & 1) != 0;
    }
  }  // namespace

  outcome::result<uint64_t> computeShuffledIndex(uint64_t index,
                                                 uint64_t index_count,
                                                 const Seed &seed,
                                                 uint64_t round_count) {
    if (index_count == 0) {
      return ShufflingError::EMPTY_LIST;
    }
    if (index >= index_count) {
      return ShufflingError::INDEX_OUT_OF_RANGE;
    }
    if (round_count > MAX_SHUFFLE_ROUND_COUNT) {
      return ShufflingError::TOO_MANY_ROUNDS;
    }

    RoundInput input{seed};
    for (uint64_t round = 0; round < round_count; ++round) {
      input.setRound(round);
      auto pivot = input.pivot(index_count);
      auto flip = (pivot + index_count - index) % index_count;
      auto position = std::max(index, flip);
      if (sourceBit(input.source(position), position)) {
        index = flip;
      }
    }
    return index;
  }

  outcome::result<void> shuffleList(std::span<ValidatorIndex> indices,
                                    const Seed &seed,
                                    uint64_t round_count) {
    if (indices.empty()) {
      return ShufflingError::EMPTY_LIST;
    }
    if (round_count > MAX_SHUFFLE_ROUND_COUNT) {
      return ShufflingError::TOO_MANY_ROUNDS;
    }

    const uint64_t count = indices.size();
    RoundInput input{seed};
    for (auto round = round_count; round-- > 0;) {
      input.setRound(round);
      auto pivot = input.pivot(count);

      // Every pair `(i, flip)` is visited once, from its larger-half member:
      // `[0, pivot]` pairs around `pivot / 2` and is decided by `i`,
      // `(pivot, count)` pairs around `(pivot + count) / 2` and is decided by
      // `flip`.
      auto mirror1 = (pivot + 2) / 2;
      auto mirror2 = (pivot + count) / 2;
      Hash256 source;
      for (auto i = mirror1; i <= mirror2; ++i) {
        uint64_t flip = 0;
        uint64_t position = 0;
        if (i <= pivot) {
          flip = pivot - i;
          position = i;
          if (i == mirror1 or position % kPositionsPerSource == 0) {
            source = input.source(position);
          }
        } else {
          flip = pivot + count - i;
          position = flip;
          if (i == pivot + 1
              or position % kPositionsPerSource == kPositionsPerSource - 1) {
            source = input.source(position);
          }
        }
        if (sourceBit(source, position)) {
          std::swap(indices[i], indices[flip]);
        }
      }
    }
    return outcome::success();
  }

}  // namespace beacon
