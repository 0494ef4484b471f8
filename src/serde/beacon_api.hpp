/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/committee.hpp"
#include "types/light_block.hpp"
#include "types/validator.hpp"

/**
 * Decoders of beacon node API responses:
 *  - `/eth/v1/beacon/states/{state_id}/validators`
 *  - `/eth/v1/beacon/states/{state_id}/committees`
 *  - `/eth/v2/beacon/blocks/{block_id}`
 * Numbers are decimal strings, byte strings are `0x`-prefixed hex.
 */
namespace beacon::serde {
  enum class BeaconApiError : uint8_t {
    MALFORMED_JSON = 1,
    MALFORMED_VALIDATOR,
    MALFORMED_COMMITTEE,
    MALFORMED_BLOCK,
  };

  /**
   * Validator registry from a validators response.
   * Registry index is the array position; an explicit `index` must agree.
   */
  outcome::result<Validators> decodeValidators(std::string_view json);

  /**
   * Committees from a committees response, in response order.
   */
  outcome::result<Committees> decodeCommittees(std::string_view json);

  /**
   * RANDAO related part of a block response.
   */
  outcome::result<LightBlock> decodeBlock(std::string_view json);
}  // namespace beacon::serde

OUTCOME_HPP_DECLARE_ERROR(beacon::serde, BeaconApiError);
