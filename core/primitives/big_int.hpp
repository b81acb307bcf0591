/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string_view>

#include "codec/json/coding.hpp"
#include "common/blob.hpp"

namespace x402::primitives {
  using BigInt = boost::multiprecision::cpp_int;
  /** Token amounts and EVM words */
  using UInt256 = boost::multiprecision::uint256_t;

  enum class BigIntError {
    kNotDecimal = 1,
    kNotHexQuantity,
    kOverflow,
  };

  /**
   * Parses decimal string of digits only, as amounts and timestamps are sent
   * @return value or error if not decimal or exceeds 2^256 - 1
   */
  outcome::result<UInt256> parseDecimal(std::string_view s);

  /** Parses JSON-RPC quantity, "0x" prefixed hex without leading zeros */
  outcome::result<UInt256> parseQuantity(std::string_view s);

  /** Encodes JSON-RPC quantity */
  std::string toQuantity(const UInt256 &v);

  /** 32 byte big-endian word */
  common::Hash256 toWord(const UInt256 &v);

  /** Big-endian bytes to number, at most 32 bytes */
  outcome::result<UInt256> fromWord(BytesIn bytes);
}  // namespace x402::primitives

namespace boost::multiprecision {
  JSON_ENCODE(x402::primitives::UInt256) {
    return x402::codec::json::encode(v.str(), allocator);
  }

  JSON_DECODE(x402::primitives::UInt256) {
    if (j.IsUint64()) {
      v = j.GetUint64();
      return;
    }
    OUTCOME_EXCEPT(value,
                   x402::primitives::parseDecimal(
                       x402::codec::json::AsString(j)));
    v = value;
  }
}  // namespace boost::multiprecision

OUTCOME_HPP_DECLARE_ERROR(x402::primitives, BigIntError);
