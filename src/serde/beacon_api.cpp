/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/beacon_api.hpp"

#include <optional>

#include <rapidjson/document.h>

#include "serde/json.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(beacon::serde, BeaconApiError, e) {
  using E = beacon::serde::BeaconApiError;
  switch (e) {
    case E::MALFORMED_JSON:
      return "Response is not valid JSON";
    case E::MALFORMED_VALIDATOR:
      return "Malformed validator entry";
    case E::MALFORMED_COMMITTEE:
      return "Malformed committee entry";
    case E::MALFORMED_BLOCK:
      return "Malformed block";
  }
  return "Unknown BeaconApiError";
}

namespace beacon::serde {
  namespace {
    struct ValidatorEntryJson {
      std::optional<ValidatorIndex> index;
      Validator validator;

      JSON_FIELDS(index, validator);
    };

    struct ValidatorsResponseJson {
      std::optional<bool> execution_optimistic;
      std::vector<ValidatorEntryJson> data;

      JSON_FIELDS(execution_optimistic, data);
    };

    struct CommitteesResponseJson {
      std::optional<bool> execution_optimistic;
      Committees data;

      JSON_FIELDS(execution_optimistic, data);
    };

    struct ExecutionPayloadJson {
      uint64_t block_number = 0;
      Hash256 prev_randao;

      JSON_FIELDS(block_number, prev_randao);
    };

    struct BlockBodyJson {
      ExecutionPayloadJson execution_payload;

      JSON_FIELDS(execution_payload);
    };

    struct BlockMessageJson {
      Slot slot = 0;
      ValidatorIndex proposer_index = 0;
      BlockBodyJson body;

      JSON_FIELDS(slot, proposer_index, body);
    };

    struct SignedBlockJson {
      BlockMessageJson message;

      JSON_FIELDS(message);
    };

    struct BlockResponseJson {
      SignedBlockJson data;

      JSON_FIELDS(data);
    };

    /**
     * Decodes `text` into `T`; shape mismatches are reported as `error`.
     */
    template <typename T>
    outcome::result<T> decodeAs(std::string_view text, BeaconApiError error) {
      rapidjson::Document document;
      document.Parse(text.data(), text.size());
      if (document.HasParseError()) {
        return BeaconApiError::MALFORMED_JSON;
      }
      T value;
      try {
        json::decode(value, json::Json{document});
      } catch (const std::runtime_error &) {
        return error;
      }
      return value;
    }
  }  // namespace

  outcome::result<Validators> decodeValidators(std::string_view json) {
    OUTCOME_TRY(response,
                decodeAs<ValidatorsResponseJson>(
                    json, BeaconApiError::MALFORMED_VALIDATOR));
    Validators validators;
    validators.reserve(response.data.size());
    for (auto &entry : response.data) {
      if (entry.index.has_value() and entry.index != validators.size()) {
        return BeaconApiError::MALFORMED_VALIDATOR;
      }
      validators.emplace_back(entry.validator);
    }
    return validators;
  }

  outcome::result<Committees> decodeCommittees(std::string_view json) {
    OUTCOME_TRY(response,
                decodeAs<CommitteesResponseJson>(
                    json, BeaconApiError::MALFORMED_COMMITTEE));
    return std::move(response.data);
  }

  outcome::result<LightBlock> decodeBlock(std::string_view json) {
    OUTCOME_TRY(
        response,
        decodeAs<BlockResponseJson>(json, BeaconApiError::MALFORMED_BLOCK));
    auto &message = response.data.message;
    return LightBlock{
        .slot = message.slot,
        .block_number = message.body.execution_payload.block_number,
        .prev_randao = message.body.execution_payload.prev_randao,
        .proposer_index = message.proposer_index,
    };
  }
}  // namespace beacon::serde
