/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "verification/committee_source.hpp"

namespace beacon::verification {

  class CommitteeSourceMock : public CommitteeSource {
   public:
    MOCK_METHOD(outcome::result<Committees>,
                committeesForEpoch,
                (Epoch epoch),
                (const, override));
  };

}  // namespace beacon::verification
