/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <string_view>

#include <qtils/byte_view.hpp>

#include "crypto/hash_types.hpp"

namespace beacon::crypto {

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::ByteView input);

  /**
   * Take a SHA-256 hash of the concatenation of `parts`
   * without materializing the concatenation.
   */
  Hash256 sha256(std::initializer_list<qtils::ByteView> parts);

}  // namespace beacon::crypto
