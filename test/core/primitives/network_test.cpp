/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/network.hpp"

#include <gtest/gtest.h>

#include "primitives/address/address_codec.hpp"
#include "testutil/outcome.hpp"

namespace x402::primitives {

  /**
   * @given every network
   * @when converting name back and forth
   * @then same network
   */
  TEST(NetworkTest, Names) {
    for (auto network : allNetworks()) {
      EXPECT_OUTCOME_EQ(networkFromName(networkName(network)), network);
    }
    EXPECT_EQ(networkName(Network::kBaseSepolia), "base-sepolia");
    EXPECT_OUTCOME_ERROR(NetworkError::kUnknownNetwork,
                         networkFromName("ethereum"));
  }

  /**
   * @given base sepolia
   * @when querying chain id and USDC deployment
   * @then 84532, 6 decimals, EIP-712 version "2"
   */
  TEST(NetworkTest, BaseSepoliaUsdc) {
    EXPECT_EQ(chainId(Network::kBaseSepolia), 84532);
    const auto &usdc{usdcDeployment(Network::kBaseSepolia)};
    EXPECT_EQ(address::encodeToString(usdc.address),
              "0x036CbD53842c5426634e7929541eC2318f3dCF7e");
    EXPECT_EQ(usdc.decimals, 6);
    EXPECT_EQ(usdc.eip712_name, "USDC");
    EXPECT_EQ(usdc.eip712_version, "2");
  }

  /**
   * @given decimal token amounts
   * @when converting to 6 decimals units
   * @then "0.05" is 50000, excess precision is rejected
   */
  TEST(NetworkTest, TokenAmount) {
    EXPECT_OUTCOME_EQ(parseTokenAmount("0.05", 6), 50000);
    EXPECT_OUTCOME_EQ(parseTokenAmount("1", 6), 1000000);
    EXPECT_OUTCOME_EQ(parseTokenAmount("12.345678", 6), 12345678);
    EXPECT_OUTCOME_ERROR(NetworkError::kInvalidAmount,
                         parseTokenAmount("0.0000001", 6));
    EXPECT_OUTCOME_ERROR(NetworkError::kInvalidAmount,
                         parseTokenAmount(".5", 6));
    EXPECT_OUTCOME_ERROR(NetworkError::kInvalidAmount,
                         parseTokenAmount("1.", 6));
    EXPECT_OUTCOME_ERROR(NetworkError::kInvalidAmount,
                         parseTokenAmount("abc", 6));
  }
}  // namespace x402::primitives
