/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace beacon {
  using Hash256 = qtils::ByteArr<32>;
}  // namespace beacon
