/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/big_int.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace x402::primitives {

  /**
   * @given decimal strings
   * @when parsing
   * @then values up to 2^256 - 1, errors for garbage and overflow
   */
  TEST(BigIntTest, ParseDecimal) {
    EXPECT_OUTCOME_EQ(parseDecimal("0"), 0);
    EXPECT_OUTCOME_EQ(parseDecimal("50000"), 50000);
    const auto max{std::numeric_limits<UInt256>::max()};
    EXPECT_OUTCOME_EQ(parseDecimal(max.str()), max);
    EXPECT_OUTCOME_ERROR(BigIntError::kOverflow,
                         parseDecimal(max.str().substr(0, 77) + "6"));
    EXPECT_OUTCOME_ERROR(BigIntError::kNotDecimal, parseDecimal(""));
    EXPECT_OUTCOME_ERROR(BigIntError::kNotDecimal, parseDecimal("-1"));
    EXPECT_OUTCOME_ERROR(BigIntError::kNotDecimal, parseDecimal("1.5"));
  }

  /**
   * @given JSON-RPC quantities
   * @when parsing and formatting
   * @then minimal lower case hex
   */
  TEST(BigIntTest, Quantity) {
    EXPECT_OUTCOME_EQ(parseQuantity("0x0"), 0);
    EXPECT_OUTCOME_EQ(parseQuantity("0x400"), 1024);
    EXPECT_OUTCOME_EQ(parseQuantity("0xFF"), 255);
    EXPECT_OUTCOME_ERROR(BigIntError::kNotHexQuantity, parseQuantity("0x"));
    EXPECT_OUTCOME_ERROR(BigIntError::kNotHexQuantity, parseQuantity("400"));
    EXPECT_OUTCOME_ERROR(BigIntError::kNotHexQuantity, parseQuantity("0xg"));
    EXPECT_EQ(toQuantity(0), "0x0");
    EXPECT_EQ(toQuantity(1024), "0x400");
    EXPECT_EQ(toQuantity(UInt256{20000000000}), "0x4a817c800");
  }

  /**
   * @given 256 bit word
   * @when converting to and from big endian bytes
   * @then value is preserved, short input is left padded, long rejected
   */
  TEST(BigIntTest, Word) {
    UInt256 value{0x1234};
    auto word{toWord(value)};
    EXPECT_EQ(
        word,
        "0000000000000000000000000000000000000000000000000000000000001234"_hash256);
    EXPECT_OUTCOME_EQ(fromWord(word), value);
    EXPECT_OUTCOME_EQ(fromWord("1234"_unhex), value);
    EXPECT_OUTCOME_ERROR(BigIntError::kOverflow, fromWord(Bytes(33, 1)));
  }
}  // namespace x402::primitives
