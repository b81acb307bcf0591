/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "primitives/address/address_codec.hpp"
#include "primitives/big_int.hpp"

namespace x402::primitives {
  using address::Address;

  enum class NetworkError {
    kUnknownNetwork = 1,
    kInvalidAmount,
  };

  /**
   * @brief EVM networks the facilitator knows how to serve
   */
  enum class Network {
    kBase,
    kBaseSepolia,
    kAvalanche,
    kAvalancheFuji,
    kPolygon,
    kPolygonAmoy,
  };

  /**
   * @brief Deployment of the EIP-3009 token on a network
   */
  struct TokenDeployment {
    Address address;
    uint8_t decimals{};
    /// EIP-712 domain name and version of the token contract
    std::string eip712_name;
    std::string eip712_version;
  };

  /** Every known network in declaration order */
  const std::vector<Network> &allNetworks();

  /** Wire name, e.g. "base-sepolia" */
  std::string_view networkName(Network network);

  outcome::result<Network> networkFromName(std::string_view name);

  /** EIP-155 chain id */
  uint64_t chainId(Network network);

  /** Canonical USDC deployment */
  const TokenDeployment &usdcDeployment(Network network);

  /**
   * Converts human readable decimal amount to token units
   * @param amount - e.g. "0.05"
   * @param decimals - token decimals
   * @return 50000 for "0.05" with 6 decimals, error if more fraction digits
   * than decimals or not a number
   */
  outcome::result<UInt256> parseTokenAmount(std::string_view amount,
                                            uint8_t decimals);

  JSON_ENCODE(Network) {
    return codec::json::encode(networkName(v), allocator);
  }

  JSON_DECODE(Network) {
    OUTCOME_EXCEPT(network, networkFromName(codec::json::AsString(j)));
    v = network;
  }
}  // namespace x402::primitives

template <>
struct fmt::formatter<x402::primitives::Network>
    : formatter<std::string_view> {
  template <typename C>
  auto format(const x402::primitives::Network &network, C &ctx) const {
    return formatter<std::string_view>::format(
        x402::primitives::networkName(network), ctx);
  }
};

OUTCOME_HPP_DECLARE_ERROR(x402::primitives, NetworkError);
