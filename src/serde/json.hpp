/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_map>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "serde/json_fwd.hpp"
#include "types/felt.hpp"

#define JSON_ASSERT(c) \
  if (not(c)) throw ::attestor::json::JsonError{"json: " #c}

namespace attestor::json {

  /// Thrown by decoding when the document does not match the expected shape
  class JsonError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  struct Json {
    const rapidjson::Value &v;
  };

  struct JsonOut {
    rapidjson::Writer<rapidjson::StringBuffer> &w;
  };

  inline rapidjson::Document parse(std::string_view json_str) {
    rapidjson::Document document;
    document.Parse(json_str.data(), json_str.size());
    JSON_ASSERT(not document.HasParseError());
    return document;
  }

  void decode(auto &v, std::string_view json_str) {
    auto document = parse(json_str);
    decode(v, Json{document});
  }

  inline std::string_view decodeStr(Json json) {
    JSON_ASSERT(json.v.IsString());
    return {json.v.GetString(), json.v.GetStringLength()};
  }

  inline void decode(std::string &v, Json json) {
    v = decodeStr(json);
  }

  inline void decode(Felt &v, Json json) {
    auto felt = Felt::fromHex(decodeStr(json));
    JSON_ASSERT(felt.has_value());
    v = felt.value();
  }

  template <typename T>
  void decode(std::unordered_map<std::string, T> &v, Json json) {
    v.clear();
    JSON_ASSERT(json.v.IsObject());
    for (auto it = json.v.MemberBegin(); it != json.v.MemberEnd(); ++it) {
      std::string key;
      decode(key, Json{it->name});
      T value;
      decode(value, Json{it->value});
      v.emplace(std::move(key), std::move(value));
    }
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
    for (auto it = json.v.Begin(); it != json.v.End(); ++it) {
      T value;
      decode(value, Json{*it});
      v.emplace_back(std::move(value));
    }
  }

  template <std::integral T>
  void decode(T &v, Json json) {
    if constexpr (std::is_same_v<T, bool>) {
      JSON_ASSERT(json.v.IsBool());
      v = json.v.GetBool();
    } else if constexpr (std::is_unsigned_v<T>) {
      JSON_ASSERT(json.v.IsUint64());
      v = static_cast<T>(json.v.GetUint64());
    } else {
      JSON_ASSERT(json.v.IsInt64());
      v = static_cast<T>(json.v.GetInt64());
    }
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

  template <typename T>
    requires requires(T &v) { enumValues(v); }
  void decode(T &v, Json json) {
    auto &enum_values = enumValues(v);
    auto str = decodeStr(json);
    for (auto &[enum_value, enum_str] : enum_values) {
      if (str == enum_str) {
        v = enum_value;
        return;
      }
    }
    JSON_ASSERT(false);
  }

  inline void encode(JsonOut out, std::string_view v) {
    out.w.String(v.data(), static_cast<rapidjson::SizeType>(v.size()));
  }

  inline void encode(JsonOut out, const std::string &v) {
    encode(out, std::string_view{v});
  }

  inline void encode(JsonOut out, const char *v) {
    encode(out, std::string_view{v});
  }

  inline void encode(JsonOut out, const Felt &v) {
    encode(out, v.toHex());
  }

  template <std::integral T>
  void encode(JsonOut out, const T &v) {
    if constexpr (std::is_same_v<T, bool>) {
      out.w.Bool(v);
    } else if constexpr (std::is_unsigned_v<T>) {
      out.w.Uint64(v);
    } else {
      out.w.Int64(v);
    }
  }

  template <typename T>
  void encode(JsonOut out, const std::optional<T> &v) {
    if (v.has_value()) {
      encode(out, *v);
    } else {
      out.w.Null();
    }
  }

  template <typename T>
  void encode(JsonOut out, const std::vector<T> &v) {
    out.w.StartArray();
    for (auto &item : v) {
      encode(out, item);
    }
    out.w.EndArray();
  }

  template <typename T>
  bool isAbsent(const T &) {
    return false;
  }

  template <typename T>
  bool isAbsent(const std::optional<T> &v) {
    return not v.has_value();
  }

  // Empty optionals are omitted rather than written as null
  template <size_t I, typename T>
  void encodeFields(const T &fields, const auto &field_names, JsonOut out) {
    auto &field = std::get<I>(fields);
    if (not isAbsent(field)) {
      auto &name = field_names.at(I);
      out.w.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
      encode(out, field);
    }
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      encodeFields<I + 1>(fields, field_names, out);
    }
  }

  template <typename T>
    requires requires(const T &v) {
      v.fieldNames();
      v.fields();
    }
  void encode(JsonOut out, const T &v) {
    out.w.StartObject();
    encodeFields<0>(v.fields(), v.fieldNames(), out);
    out.w.EndObject();
  }

  template <typename T>
    requires requires(const T &v) { enumValues(v); }
  void encode(JsonOut out, const T &v) {
    for (auto &[enum_value, enum_str] : enumValues(v)) {
      if (v == enum_value) {
        encode(out, enum_str);
        return;
      }
    }
    JSON_ASSERT(false);
  }

  std::string encode(const auto &v) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
    encode(JsonOut{writer}, v);
    return {buffer.GetString(), buffer.GetSize()};
  }

}  // namespace attestor::json
