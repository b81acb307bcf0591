/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <chrono>
#include <map>

#include "common/logger.hpp"
#include "primitives/address/address.hpp"
#include "primitives/network.hpp"

namespace x402::node {
  using primitives::Network;
  using primitives::address::Address;

  struct Config {
    spdlog::level::level_enum log_level;
    std::string host;
    unsigned short port{};
    /** JSON-RPC endpoint per network, absent networks are not served */
    std::map<Network, std::string> rpc_urls;
    std::string signer_key_path;
    std::chrono::seconds rpc_timeout{};
    uint64_t gas_limit{};

    /** Tolerance of payer clock for validAfter */
    std::chrono::seconds skew{};
    bool check_balance{};
    std::chrono::milliseconds poll_interval{};
    std::chrono::seconds reconcile_period{};

    // stream offer
    bool stream_enabled{};
    Network stream_network{};
    uint64_t unit_seconds{};
    std::string price_per_unit;
    Address pay_to;
    std::string resource;
    double require_fraction{};
    std::chrono::seconds ttl{};
    uint64_t window_grace{};
    std::chrono::milliseconds tick_interval{};
    std::chrono::seconds keepalive_interval{};

    static Config read(int argc, char *argv[]);
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace x402::node
