/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// Starknet JSON-RPC uses snake_case member names, same as the C++ fields
#define _JSON_NAMES_1(name) std::string{#name}
#define _JSON_NAMES_2(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_1(__VA_ARGS__)
#define _JSON_NAMES_3(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_2(__VA_ARGS__)
#define _JSON_NAMES_4(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_3(__VA_ARGS__)
#define _JSON_NAMES_5(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_4(__VA_ARGS__)
#define _JSON_NAMES_6(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_5(__VA_ARGS__)
#define _JSON_NAMES_7(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_6(__VA_ARGS__)
#define _JSON_NAMES_8(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_7(__VA_ARGS__)
#define _JSON_NAMES_9(name, ...) _JSON_NAMES_1(name), _JSON_NAMES_8(__VA_ARGS__)
#define _JSON_NAMES_10(name, ...) \
  _JSON_NAMES_1(name), _JSON_NAMES_9(__VA_ARGS__)
#define _JSON_NAMES_11(name, ...) \
  _JSON_NAMES_1(name), _JSON_NAMES_10(__VA_ARGS__)
#define _JSON_NAMES_12(name, ...) \
  _JSON_NAMES_1(name), _JSON_NAMES_11(__VA_ARGS__)
#define _JSON_NAMES_13(name, ...) \
  _JSON_NAMES_1(name), _JSON_NAMES_12(__VA_ARGS__)
#define _JSON_NAMES_14(name, ...) \
  _JSON_NAMES_1(name), _JSON_NAMES_13(__VA_ARGS__)
#define _JSON_NAMES_OVERLOAD(_1,                \
                             _2,                \
                             _3,                \
                             _4,                \
                             _5,                \
                             _6,                \
                             _7,                \
                             _8,                \
                             _9,                \
                             _10,               \
                             _11,               \
                             _12,               \
                             _13,               \
                             _14,               \
                             macro,             \
                             ...)               \
  macro
#define _JSON_NAMES_OVERLOAD_CALL(macro, ...) macro(__VA_ARGS__)
#define _JSON_NAMES(...)                                     \
  _JSON_NAMES_OVERLOAD_CALL(_JSON_NAMES_OVERLOAD(__VA_ARGS__, \
                                                 _JSON_NAMES_14, \
                                                 _JSON_NAMES_13, \
                                                 _JSON_NAMES_12, \
                                                 _JSON_NAMES_11, \
                                                 _JSON_NAMES_10, \
                                                 _JSON_NAMES_9,  \
                                                 _JSON_NAMES_8,  \
                                                 _JSON_NAMES_7,  \
                                                 _JSON_NAMES_6,  \
                                                 _JSON_NAMES_5,  \
                                                 _JSON_NAMES_4,  \
                                                 _JSON_NAMES_3,  \
                                                 _JSON_NAMES_2,  \
                                                 _JSON_NAMES_1), \
                            __VA_ARGS__)

#define JSON_FIELDS(...)                                     \
  static const auto &fieldNames() {                          \
    static std::array field_names{_JSON_NAMES(__VA_ARGS__)}; \
    return field_names;                                      \
  }                                                          \
  auto fields() {                                            \
    return std::tie(__VA_ARGS__);                            \
  }                                                          \
  auto fields() const {                                      \
    return std::tie(__VA_ARGS__);                            \
  }

#define JSON_ENUM(type, ...)                                              \
  inline const auto &enumValues(const type &) {                           \
    static std::vector<std::pair<type, std::string>> values{__VA_ARGS__}; \
    return values;                                                        \
  }
