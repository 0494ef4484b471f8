/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/checked_math.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon, ArithmeticError, e) {
  using E = beacon::ArithmeticError;
  switch (e) {
    case E::MULTIPLICATION_OVERFLOW:
      return "Multiplication overflows 64 bits";
  }
  return "Unknown ArithmeticError";
}
