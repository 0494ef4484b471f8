/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/seed.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"

using beacon::ChainConfig;
using beacon::RandaoMixes;

TEST(SeedTest, MixEpochLagsByLookahead) {
  auto config = ChainConfig::minimal();
  EXPECT_EQ(beacon::seedMixEpoch(5, config), 3);
  EXPECT_EQ(beacon::seedMixEpoch(2, config), 0);
  // Wraps to the end of the ring
  EXPECT_EQ(beacon::seedMixEpoch(0, config), 62);
  EXPECT_EQ(beacon::seedMixEpoch(1, config), 63);
  EXPECT_EQ(beacon::seedMixEpoch(64 + 5, config), 3);
}

TEST(SeedTest, MixEpochOfHugeEpochDoesNotOverflow) {
  auto config = ChainConfig::mainnet();
  EXPECT_EQ(beacon::seedMixEpoch(beacon::FAR_FUTURE_EPOCH, config),
            (beacon::FAR_FUTURE_EPOCH % 65536 + 65536 - 2) % 65536);
}

/**
 * @given a ring holding a known mix where the seed of epoch 5 reads
 * @when computing the attester seed
 * @then it is sha256(domain ‖ uint64_le(epoch) ‖ mix)
 */
TEST(SeedTest, KnownAttesterSeed) {
  auto config = ChainConfig::minimal();
  RandaoMixes mixes{config.epochs_per_historical_vector};
  mixes.set(3, "mix"_arr32);

  auto seed =
      beacon::computeSeed(mixes, 5, beacon::DOMAIN_BEACON_ATTESTER, config);
  EXPECT_EQ(seed.toHex(),
            "987feb290aefff23cd6f7b15e565a370b12e7a8c1d4c47c8dddb6e785faf82e6");
}

TEST(SeedTest, Deterministic) {
  auto config = ChainConfig::minimal();
  RandaoMixes mixes{config.epochs_per_historical_vector};
  mixes.set(10, "mix"_arr32);
  EXPECT_EQ(
      beacon::computeSeed(mixes, 12, beacon::DOMAIN_BEACON_ATTESTER, config),
      beacon::computeSeed(mixes, 12, beacon::DOMAIN_BEACON_ATTESTER, config));
}

TEST(SeedTest, DomainAndEpochSeparate) {
  auto config = ChainConfig::minimal();
  RandaoMixes mixes{config.epochs_per_historical_vector};
  auto attester =
      beacon::computeSeed(mixes, 7, beacon::DOMAIN_BEACON_ATTESTER, config);
  EXPECT_NE(
      attester,
      beacon::computeSeed(mixes, 7, beacon::DOMAIN_BEACON_PROPOSER, config));
  // Same (zero) mix, different epoch
  EXPECT_NE(
      attester,
      beacon::computeSeed(mixes, 8, beacon::DOMAIN_BEACON_ATTESTER, config));
}

TEST(SeedTest, OnlyLookaheadMixMatters) {
  auto config = ChainConfig::minimal();
  RandaoMixes mixes{config.epochs_per_historical_vector};
  auto before =
      beacon::computeSeed(mixes, 5, beacon::DOMAIN_BEACON_ATTESTER, config);
  mixes.set(4, "unrelated"_arr32);
  EXPECT_EQ(
      before,
      beacon::computeSeed(mixes, 5, beacon::DOMAIN_BEACON_ATTESTER, config));
  mixes.set(3, "related"_arr32);
  EXPECT_NE(
      before,
      beacon::computeSeed(mixes, 5, beacon::DOMAIN_BEACON_ATTESTER, config));
}
