/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace beacon {
  enum class ArithmeticError : uint8_t {
    MULTIPLICATION_OVERFLOW = 1,
  };

  /**
   * Multiplies two chain values.
   * Fails instead of wrapping around when the product exceeds 64 bits.
   */
  inline outcome::result<uint64_t> checkedMul(uint64_t l, uint64_t r) {
    uint64_t product = 0;
    if (__builtin_mul_overflow(l, r, &product)) {
      return ArithmeticError::MULTIPLICATION_OVERFLOW;
    }
    return product;
  }
}  // namespace beacon

OUTCOME_HPP_DECLARE_ERROR(beacon, ArithmeticError);
