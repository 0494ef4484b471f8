/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_arr.hpp>

#include "serde/json_fwd.hpp"
#include "types/constants.hpp"
#include "types/slot.hpp"

namespace beacon {
  using BlsPublicKey = qtils::ByteArr<BLS_PUBLIC_KEY_SIZE>;

  struct Validator {
    BlsPublicKey pubkey;
    Epoch activation_epoch = FAR_FUTURE_EPOCH;
    Epoch exit_epoch = FAR_FUTURE_EPOCH;
    uint64_t effective_balance = 0;

    bool operator==(const Validator &) const = default;

    JSON_FIELDS(pubkey, activation_epoch, exit_epoch, effective_balance);
  };

  /// Registry ordered by validator index
  using Validators = std::vector<Validator>;
}  // namespace beacon
