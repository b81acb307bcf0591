/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/big_int.hpp"

namespace x402::primitives {
  /// 2^256 - 1 has 78 decimal digits
  constexpr size_t kMaxDecimalDigits = 78;
  constexpr size_t kMaxHexDigits = 64;

  outcome::result<UInt256> parseDecimal(std::string_view s) {
    if (s.empty()) {
      return BigIntError::kNotDecimal;
    }
    if (s.size() > kMaxDecimalDigits) {
      return BigIntError::kOverflow;
    }
    BigInt value;
    for (auto c : s) {
      if (c < '0' || c > '9') {
        return BigIntError::kNotDecimal;
      }
      value = value * 10 + (c - '0');
    }
    if (value > BigInt{std::numeric_limits<UInt256>::max()}) {
      return BigIntError::kOverflow;
    }
    return UInt256{value};
  }

  outcome::result<UInt256> parseQuantity(std::string_view s) {
    if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) {
      return BigIntError::kNotHexQuantity;
    }
    s.remove_prefix(2);
    if (s.size() > kMaxHexDigits) {
      return BigIntError::kOverflow;
    }
    UInt256 value;
    for (auto c : s) {
      unsigned digit{};
      if (c >= '0' && c <= '9') {
        digit = c - '0';
      } else if (c >= 'a' && c <= 'f') {
        digit = c - 'a' + 10;
      } else if (c >= 'A' && c <= 'F') {
        digit = c - 'A' + 10;
      } else {
        return BigIntError::kNotHexQuantity;
      }
      value = (value << 4) | digit;
    }
    return value;
  }

  std::string toQuantity(const UInt256 &v) {
    if (v == 0) {
      return "0x0";
    }
    std::string hex;
    auto x{v};
    while (x != 0) {
      hex.push_back("0123456789abcdef"[static_cast<unsigned>(x & 0xf)]);
      x >>= 4;
    }
    hex += "x0";
    return {hex.rbegin(), hex.rend()};
  }

  common::Hash256 toWord(const UInt256 &v) {
    Bytes bytes;
    export_bits(v, std::back_inserter(bytes), 8);
    common::Hash256 word;
    std::copy(bytes.begin(), bytes.end(), word.end() - bytes.size());
    return word;
  }

  outcome::result<UInt256> fromWord(BytesIn bytes) {
    if (bytes.size() > common::Hash256::size()) {
      return BigIntError::kOverflow;
    }
    UInt256 value;
    if (!bytes.empty()) {
      import_bits(value, bytes.begin(), bytes.end());
    }
    return value;
  }
}  // namespace x402::primitives

OUTCOME_CPP_DEFINE_CATEGORY(x402::primitives, BigIntError, e) {
  using E = x402::primitives::BigIntError;
  switch (e) {
    case E::kNotDecimal:
      return "BigIntError: not a decimal string";
    case E::kNotHexQuantity:
      return "BigIntError: not a hex quantity";
    case E::kOverflow:
      return "BigIntError: value exceeds 256 bits";
  }
  return "BigIntError: unknown error";
}
