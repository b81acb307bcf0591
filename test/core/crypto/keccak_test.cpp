/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#include <gtest/gtest.h>

#include "common/span.hpp"
#include "testutil/literals.hpp"

namespace x402::crypto::keccak {

  /**
   * @given empty input
   * @when hashing
   * @then Ethereum keccak256 of empty string
   */
  TEST(KeccakTest, Empty) {
    EXPECT_EQ(
        keccak256({}),
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"_hash256);
  }

  /**
   * @given "abc"
   * @when hashing
   * @then known digest, differs from SHA3-256
   */
  TEST(KeccakTest, Abc) {
    EXPECT_EQ(
        keccak256(common::span::cbytes(std::string_view{"abc"})),
        "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"_hash256);
  }

  /**
   * @given input longer than one block
   * @when hashing at once and in uneven chunks
   * @then digests are equal
   */
  TEST(KeccakTest, Incremental) {
    Bytes input(3 * kRate + 17);
    for (size_t i{0}; i < input.size(); ++i) {
      input[i] = static_cast<uint8_t>(i * 7);
    }
    Ctx ctx;
    BytesIn in{input};
    ctx.update(in.subspan(0, 1));
    ctx.update(in.subspan(1, kRate));
    ctx.update(in.subspan(1 + kRate));
    EXPECT_EQ(ctx.final(), keccak256(input));
  }
}  // namespace x402::crypto::keccak
