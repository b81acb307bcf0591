/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/network.hpp"

#include <map>

namespace x402::primitives {
  namespace {
    struct NetworkInfo {
      std::string_view name;
      uint64_t chain_id;
      std::string_view usdc;
      std::string_view eip712_name;
    };

    const NetworkInfo &info(Network network) {
      static const std::map<Network, NetworkInfo> kInfo{
          {Network::kBase,
           {"base",
            8453,
            "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913",
            "USD Coin"}},
          {Network::kBaseSepolia,
           {"base-sepolia",
            84532,
            "0x036CbD53842c5426634e7929541eC2318f3dCF7e",
            "USDC"}},
          {Network::kAvalanche,
           {"avalanche",
            43114,
            "0xB97EF9Ef8734C71904D8002F8b6Bc66Dd9c48a6E",
            "USD Coin"}},
          {Network::kAvalancheFuji,
           {"avalanche-fuji",
            43113,
            "0x5425890298aed601595a70AB815c96711a31Bc65",
            "USD Coin"}},
          {Network::kPolygon,
           {"polygon",
            137,
            "0x3c499c542cEF5E3811e1192ce70d8cC03d5c3359",
            "USD Coin"}},
          {Network::kPolygonAmoy,
           {"polygon-amoy",
            80002,
            "0x41E94Eb019C0762f9Bfcf9Fb1E58725BfB0e7582",
            "USDC"}},
      };
      return kInfo.at(network);
    }

    /// All USDC deployments are 6 decimals, EIP-712 version "2"
    constexpr uint8_t kUsdcDecimals = 6;
    constexpr auto kUsdcVersion = "2";
  }  // namespace

  const std::vector<Network> &allNetworks() {
    static const std::vector<Network> kAll{Network::kBase,
                                           Network::kBaseSepolia,
                                           Network::kAvalanche,
                                           Network::kAvalancheFuji,
                                           Network::kPolygon,
                                           Network::kPolygonAmoy};
    return kAll;
  }

  std::string_view networkName(Network network) {
    return info(network).name;
  }

  outcome::result<Network> networkFromName(std::string_view name) {
    for (auto network : allNetworks()) {
      if (info(network).name == name) {
        return network;
      }
    }
    return NetworkError::kUnknownNetwork;
  }

  uint64_t chainId(Network network) {
    return info(network).chain_id;
  }

  const TokenDeployment &usdcDeployment(Network network) {
    static const auto kDeployments{[] {
      std::map<Network, TokenDeployment> deployments;
      for (auto network : allNetworks()) {
        const auto &i{info(network)};
        deployments.emplace(
            network,
            TokenDeployment{address::decodeFromString(i.usdc).value(),
                            kUsdcDecimals,
                            std::string{i.eip712_name},
                            kUsdcVersion});
      }
      return deployments;
    }()};
    return kDeployments.at(network);
  }

  outcome::result<UInt256> parseTokenAmount(std::string_view amount,
                                            uint8_t decimals) {
    auto dot{amount.find('.')};
    auto whole{amount.substr(0, dot)};
    std::string_view fraction;
    if (dot != std::string_view::npos) {
      fraction = amount.substr(dot + 1);
      if (fraction.empty() || fraction.size() > decimals) {
        return NetworkError::kInvalidAmount;
      }
    }
    if (whole.empty()) {
      return NetworkError::kInvalidAmount;
    }
    std::string digits{whole};
    digits += fraction;
    digits.append(decimals - fraction.size(), '0');
    auto value{parseDecimal(digits)};
    if (!value) {
      return NetworkError::kInvalidAmount;
    }
    return value.value();
  }
}  // namespace x402::primitives

OUTCOME_CPP_DEFINE_CATEGORY(x402::primitives, NetworkError, e) {
  using E = x402::primitives::NetworkError;
  switch (e) {
    case E::kUnknownNetwork:
      return "NetworkError: unknown network";
    case E::kInvalidAmount:
      return "NetworkError: invalid token amount";
  }
  return "NetworkError: unknown error";
}
