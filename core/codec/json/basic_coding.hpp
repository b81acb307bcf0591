/**
* Copyright Soramitsu Co., Ltd. All Rights Reserved.
* SPDX-License-Identifier: Apache-2.0
*/

#pragma once

#include <rapidjson/document.h>

#include <boost/optional.hpp>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "codec/json/json_errors.hpp"
#include "common/outcome.hpp"

#define COMMA ,

#define JSON_ENCODE(type)                 \
  inline x402::codec::json::Value encode( \
      const type &v, rapidjson::MemoryPoolAllocator<> &allocator)

// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define JSON_DECODE(type) \
  inline void decode(type &v, const x402::codec::json::Value &j)

namespace x402::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;

  template <typename T>
  T innerDecode(const Value &j);

  template <typename T>
  void Set(Value &j,
           std::string_view key,
           const T &v,
           rapidjson::MemoryPoolAllocator<> &allocator);

  template <typename T>
  inline T kDefaultT() {
    return {};
  }

  inline std::string AsString(const Value &j) {
    if (!j.IsString()) {
      outcome::raise(JsonError::kWrongType);
    }
    return {j.GetString(), j.GetStringLength()};
  }

  /** Parses whole decimal string, rejects sign, garbage and overflow */
  inline uint64_t parseUint(const Value &j) {
    auto s{AsString(j)};
    if (s.empty() || s.size() > 20) {
      outcome::raise(JsonError::kWrongType);
    }
    uint64_t value{};
    for (auto c : s) {
      if (c < '0' || c > '9') {
        outcome::raise(JsonError::kWrongType);
      }
      const uint64_t digit = c - '0';
      if (value > (UINT64_MAX - digit) / 10) {
        outcome::raise(JsonError::kOutOfRange);
      }
      value = value * 10 + digit;
    }
    return value;
  }

  JSON_ENCODE(int64_t) {
    return Value{v};
  }

  JSON_DECODE(int64_t) {
    if (j.IsInt64()) {
      v = j.GetInt64();
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(uint64_t) {
    return Value{v};
  }

  JSON_DECODE(uint64_t) {
    if (j.IsUint64()) {
      v = j.GetUint64();
    } else if (j.IsString()) {
      v = parseUint(j);
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(uint32_t) {
    return Value{v};
  }

  JSON_DECODE(uint32_t) {
    uint64_t u64{};
    decode(u64, j);
    if (u64 > UINT32_MAX) {
      outcome::raise(JsonError::kOutOfRange);
    }
    v = static_cast<uint32_t>(u64);
  }

  JSON_ENCODE(double) {
    return Value{v};
  }

  JSON_DECODE(double) {
    if (j.IsNumber()) {
      v = j.GetDouble();
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(bool) {
    return Value{v};
  }

  JSON_DECODE(bool) {
    if (!j.IsBool()) {
      outcome::raise(JsonError::kWrongType);
    }
    v = j.GetBool();
  }

  JSON_ENCODE(std::string_view) {
    return {v.data(), static_cast<rapidjson::SizeType>(v.size()), allocator};
  }

  JSON_DECODE(std::string) {
    v = AsString(j);
  }

  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<T, uint8_t>>>
  JSON_ENCODE(std::vector<T>) {
    Value j{rapidjson::kArrayType};
    j.Reserve(v.size(), allocator);
    for (const auto &elem : v) {
      j.PushBack(encode(elem, allocator), allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::vector<T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsArray()) {
      outcome::raise(JsonError::kWrongType);
    }
    v.reserve(j.Size());

    for (const auto &it : j.GetArray()) {
      v.emplace_back(innerDecode<T>(it));
    }
  }

  template <typename T>
  JSON_ENCODE(std::map<std::string COMMA T>) {
    Value j{rapidjson::kObjectType};
    j.MemberReserve(v.size(), allocator);
    for (const auto &pair : v) {
      Set(j, pair.first, pair.second, allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::map<std::string COMMA T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    for (auto it = j.MemberBegin(); it != j.MemberEnd(); ++it) {
      v.emplace(AsString(it->name), innerDecode<T>(it->value));
    }
  }

  template <typename T>
  JSON_ENCODE(boost::optional<T>) {
    if (v) {
      return encode(*v, allocator);
    }
    return {};
  }

  template <typename T>
  JSON_DECODE(boost::optional<T>) {
    if (!j.IsNull()) {
      v = innerDecode<T>(j);
    }
  }
}  // namespace x402::codec::json
