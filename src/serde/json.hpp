/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <charconv>
#include <concepts>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <qtils/byte_arr.hpp>
#include <rapidjson/document.h>

#include "serde/json_fwd.hpp"

#define JSON_ASSERT(c) \
  if (not(c)) throw std::runtime_error{"json"}

namespace beacon::json {
  struct Json {
    const rapidjson::Value &v;
  };

  /**
   * Decodes `json_str` into `v`.
   * Throws `std::runtime_error` on malformed input or mismatching shape.
   */
  void decode(auto &v, std::string_view json_str) {
    rapidjson::Document document;
    document.Parse(json_str.data(), json_str.size());
    JSON_ASSERT(not document.HasParseError());
    decode(v, Json{document});
  }

  inline std::string_view decodeStr(Json json) {
    JSON_ASSERT(json.v.IsString());
    return {json.v.GetString(), json.v.GetStringLength()};
  }

  inline void decode(std::string &v, Json json) {
    v = decodeStr(json);
  }

  inline void decode(bool &v, Json json) {
    JSON_ASSERT(json.v.IsBool());
    v = json.v.GetBool();
  }

  template <typename T>
  void decode(std::optional<T> &v, Json json) {
    v.reset();
    if (not json.v.IsNull()) {
      T value;
      decode(value, json);
      v.emplace(std::move(value));
    }
  }

  template <typename T>
  void decode(std::vector<T> &v, Json json) {
    v.clear();
    JSON_ASSERT(json.v.IsArray());
    v.reserve(json.v.Size());
    for (auto it = json.v.Begin(); it != json.v.End(); ++it) {
      T value;
      decode(value, Json{*it});
      v.emplace_back(std::move(value));
    }
  }

  /// Beacon API quotes 64-bit numbers, plain JSON numbers are accepted too
  template <std::unsigned_integral T>
    requires(not std::is_same_v<T, bool>)
  void decode(T &v, Json json) {
    if (json.v.IsString()) {
      auto str = decodeStr(json);
      auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), v);
      JSON_ASSERT(ec == std::errc{} and ptr == str.data() + str.size()
                  and not str.empty());
      return;
    }
    JSON_ASSERT(json.v.IsUint64());
    auto value = json.v.GetUint64();
    JSON_ASSERT(value <= std::numeric_limits<T>::max());
    v = static_cast<T>(value);
  }

  template <size_t I, typename T>
  void decodeFields(const T &fields, const auto &field_names, Json json) {
    JSON_ASSERT(json.v.IsObject());
    auto &field = std::get<I>(fields);
    auto &field_name = field_names.at(I);
    auto it = json.v.FindMember(field_name.c_str());
    static const rapidjson::Value json_null;
    decode(field, Json{it != json.v.MemberEnd() ? it->value : json_null});
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      decodeFields<I + 1>(fields, field_names, json);
    }
  }

  template <typename T>
    requires requires(T &v) {
      v.fieldNames();
      v.fields();
    }
  void decode(T &v, Json json) {
    auto fields = v.fields();
    auto &field_names = v.fieldNames();
    decodeFields<0>(fields, field_names, json);
  }

  template <size_t N>
  void decode(qtils::ByteArr<N> &v, Json json) {
    auto r = qtils::ByteArr<N>::fromHexWithPrefix(decodeStr(json));
    JSON_ASSERT(r.has_value());
    v = r.value();
  }
}  // namespace beacon::json
