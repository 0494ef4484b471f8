/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/beacon_api.hpp"

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "types/constants.hpp"

using beacon::serde::BeaconApiError;
using testing::ElementsAre;

namespace {
  constexpr std::string_view kPubkey0 =
      "0x933ad9491b62059dd065b560d256d8957a8c402cc6e8d8ee7290ae11e8f7329267a8811"
      "c397529dac52ae1342ba58c95";
  constexpr std::string_view kPubkey1 =
      "0xa1d1ad0714035353258038e964ae9675dc0252ee22cea896825c01458e1807bfad2f9"
      "969338798548d9858a571f7425c";
}  // namespace

TEST(BeaconApiTest, DecodeValidators) {
  auto json = fmt::format(R"({{
    "execution_optimistic": false,
    "finalized": true,
    "data": [
      {{
        "index": "0",
        "balance": "32000000000",
        "status": "active_ongoing",
        "validator": {{
          "pubkey": "{}",
          "withdrawal_credentials": "0x00",
          "effective_balance": "32000000000",
          "slashed": false,
          "activation_eligibility_epoch": "0",
          "activation_epoch": "0",
          "exit_epoch": "18446744073709551615",
          "withdrawable_epoch": "18446744073709551615"
        }}
      }},
      {{
        "index": "1",
        "validator": {{
          "pubkey": "{}",
          "effective_balance": "31000000000",
          "activation_epoch": "12",
          "exit_epoch": "300"
        }}
      }}
    ]
  }})",
                          kPubkey0,
                          kPubkey1);

  ASSERT_OUTCOME_SUCCESS(validators, beacon::serde::decodeValidators(json));
  ASSERT_EQ(validators.size(), 2);
  EXPECT_EQ(validators[0].pubkey.toHex(), kPubkey0.substr(2));
  EXPECT_EQ(validators[0].activation_epoch, 0);
  EXPECT_EQ(validators[0].exit_epoch, beacon::FAR_FUTURE_EPOCH);
  EXPECT_EQ(validators[0].effective_balance, 32'000'000'000);
  EXPECT_EQ(validators[1].pubkey.toHex(), kPubkey1.substr(2));
  EXPECT_EQ(validators[1].activation_epoch, 12);
  EXPECT_EQ(validators[1].exit_epoch, 300);
  EXPECT_EQ(validators[1].effective_balance, 31'000'000'000);
}

TEST(BeaconApiTest, ValidatorIndexIsArrayPosition) {
  auto json = fmt::format(R"({{"data": [
    {{"index": "0", "validator": {{"pubkey": "{0}", "effective_balance": "1",
      "activation_epoch": "0", "exit_epoch": "1"}}}},
    {{"index": "2", "validator": {{"pubkey": "{0}", "effective_balance": "1",
      "activation_epoch": "0", "exit_epoch": "1"}}}}
  ]}})",
                          kPubkey0);
  auto res = beacon::serde::decodeValidators(json);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_VALIDATOR);
}

TEST(BeaconApiTest, MalformedValidator) {
  // Epoch is not a number
  auto res = beacon::serde::decodeValidators(fmt::format(
      R"({{"data": [{{"validator": {{"pubkey": "{}", "effective_balance": "1",
      "activation_epoch": "soon", "exit_epoch": "1"}}}}]}})",
      kPubkey0));
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_VALIDATOR);

  // Public key is too short
  res = beacon::serde::decodeValidators(
      R"({"data": [{"validator": {"pubkey": "0x1234", "effective_balance": "1",
      "activation_epoch": "0", "exit_epoch": "1"}}]})");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_VALIDATOR);

  // No data at all
  EXPECT_OUTCOME_ERROR(beacon::serde::decodeValidators(R"({})"));
}

TEST(BeaconApiTest, MalformedJson) {
  auto res = beacon::serde::decodeValidators(R"({"data": [)");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_JSON);

  auto committees = beacon::serde::decodeCommittees("not json");
  ASSERT_TRUE(committees.has_error());
  EXPECT_EQ(committees.error(), BeaconApiError::MALFORMED_JSON);
}

TEST(BeaconApiTest, DecodeCommittees) {
  ASSERT_OUTCOME_SUCCESS(committees, beacon::serde::decodeCommittees(R"({
    "execution_optimistic": false,
    "data": [
      {"index": "0", "slot": "6240000", "validators": ["17", "4", "912"]},
      {"index": "1", "slot": "6240000", "validators": ["3"]},
      {"index": "0", "slot": "6240001", "validators": []}
    ]
  })"));
  ASSERT_EQ(committees.size(), 3);
  EXPECT_EQ(committees[0].slot, 6'240'000);
  EXPECT_EQ(committees[0].index, 0);
  EXPECT_THAT(committees[0].validators, ElementsAre(17, 4, 912));
  EXPECT_EQ(committees[1].index, 1);
  EXPECT_THAT(committees[1].validators, ElementsAre(3));
  EXPECT_EQ(committees[2].slot, 6'240'001);
  EXPECT_TRUE(committees[2].validators.empty());
}

TEST(BeaconApiTest, MalformedCommittee) {
  auto res = beacon::serde::decodeCommittees(
      R"({"data": [{"index": "0", "slot": "1", "validators": ["-1"]}]})");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_COMMITTEE);

  res = beacon::serde::decodeCommittees(
      R"({"data": [{"index": "0", "validators": ["1"]}]})");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_COMMITTEE);
}

TEST(BeaconApiTest, DecodeBlock) {
  ASSERT_OUTCOME_SUCCESS(block, beacon::serde::decodeBlock(R"({
    "version": "deneb",
    "execution_optimistic": false,
    "data": {
      "message": {
        "slot": "6240000",
        "proposer_index": "210345",
        "parent_root": "0x00",
        "body": {
          "randao_reveal": "0x00",
          "execution_payload": {
            "block_number": "18123456",
            "prev_randao": "0x5f3b3a8f2b3c6a0e1b7d9c4e2f1a0b3c4d5e6f708192a3b4c5d6e7f8091a2b3c"
          }
        }
      }
    }
  })"));
  EXPECT_EQ(block.slot, 6'240'000);
  EXPECT_EQ(block.proposer_index, 210'345);
  EXPECT_EQ(block.block_number, 18'123'456);
  EXPECT_EQ(
      block.prev_randao.toHex(),
      "5f3b3a8f2b3c6a0e1b7d9c4e2f1a0b3c4d5e6f708192a3b4c5d6e7f8091a2b3c");
}

TEST(BeaconApiTest, MalformedBlock) {
  auto res = beacon::serde::decodeBlock(R"({"data": {"message": {
    "slot": "1", "proposer_index": "1",
    "body": {"execution_payload": {"block_number": "1"}}}}})");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), BeaconApiError::MALFORMED_BLOCK);
}
