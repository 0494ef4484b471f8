/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>

#include <qtils/byte_arr.hpp>

namespace beacon {

  /// Epoch value of a validator that has not been activated or will not exit
  static constexpr uint64_t FAR_FUTURE_EPOCH =
      std::numeric_limits<uint64_t>::max();

  static constexpr size_t BLS_PUBLIC_KEY_SIZE = 48;

  /// Round counters are serialized as a single byte
  static constexpr uint64_t MAX_SHUFFLE_ROUND_COUNT = 256;

  using DomainType = qtils::ByteArr<4>;

  // Signature domains, little-endian encoded
  constexpr DomainType DOMAIN_BEACON_PROPOSER{0, 0, 0, 0};
  constexpr DomainType DOMAIN_BEACON_ATTESTER{1, 0, 0, 0};
  constexpr DomainType DOMAIN_RANDAO{2, 0, 0, 0};
  constexpr DomainType DOMAIN_DEPOSIT{3, 0, 0, 0};
  constexpr DomainType DOMAIN_VOLUNTARY_EXIT{4, 0, 0, 0};
  constexpr DomainType DOMAIN_SELECTION_PROOF{5, 0, 0, 0};
  constexpr DomainType DOMAIN_AGGREGATE_AND_PROOF{6, 0, 0, 0};
  constexpr DomainType DOMAIN_APPLICATION_MASK{0, 0, 0, 1};

}  // namespace beacon
