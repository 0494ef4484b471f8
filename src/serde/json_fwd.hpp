/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string>
#include <tuple>

#define _JSON_NAMES_1(name) std::string{#name}
#define _JSON_NAMES_2(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_1(__VA_ARGS__)
#define _JSON_NAMES_3(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_2(__VA_ARGS__)
#define _JSON_NAMES_4(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_3(__VA_ARGS__)
#define _JSON_NAMES_5(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_4(__VA_ARGS__)
#define _JSON_NAMES_6(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_5(__VA_ARGS__)
#define _JSON_NAMES_OVERLOAD(_1, _2, _3, _4, _5, _6, macro, ...) macro
#define _JSON_NAMES_OVERLOAD_CALL(macro, ...) macro(__VA_ARGS__)
#define _JSON_NAMES(...)                                              \
  _JSON_NAMES_OVERLOAD_CALL(_JSON_NAMES_OVERLOAD(__VA_ARGS__,         \
                                                 _JSON_NAMES_6,       \
                                                 _JSON_NAMES_5,       \
                                                 _JSON_NAMES_4,       \
                                                 _JSON_NAMES_3,       \
                                                 _JSON_NAMES_2,       \
                                                 _JSON_NAMES_1),      \
                            __VA_ARGS__)

/**
 * Declares JSON object fields of a struct.
 * Keys are the member names as written (beacon API uses snake_case).
 */
#define JSON_FIELDS(...)                                     \
  static const auto &fieldNames() {                          \
    static std::array field_names{_JSON_NAMES(__VA_ARGS__)}; \
    return field_names;                                      \
  }                                                          \
  auto fields() {                                            \
    return std::tie(__VA_ARGS__);                            \
  }
