/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "chain/chain_client.hpp"
#include "payment/types.hpp"

namespace x402::facilitator {
  using chain::ChainClient;
  using primitives::TokenDeployment;

  /**
   * Active network with its token deployment and chain access
   */
  struct NetworkEntry {
    Network network{};
    uint64_t chain_id{};
    TokenDeployment token;
    std::shared_ptr<ChainClient> client;
  };

  /**
   * Immutable catalogue of networks for which an endpoint was configured
   */
  class NetworkRegistry {
   public:
    explicit NetworkRegistry(std::vector<NetworkEntry> entries);

    /** @return entry or nullptr if network is not served */
    const NetworkEntry *find(Network network) const;

    /** Entries in configuration order */
    const std::vector<NetworkEntry> &entries() const;

    std::vector<payment::SupportedKind> supported() const;

   private:
    std::vector<NetworkEntry> entries_;
  };
}  // namespace x402::facilitator
