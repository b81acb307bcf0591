/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "facilitator/network_registry.hpp"

namespace x402::facilitator {
  NetworkRegistry::NetworkRegistry(std::vector<NetworkEntry> entries)
      : entries_{std::move(entries)} {}

  const NetworkEntry *NetworkRegistry::find(Network network) const {
    for (const auto &entry : entries_) {
      if (entry.network == network) {
        return &entry;
      }
    }
    return nullptr;
  }

  const std::vector<NetworkEntry> &NetworkRegistry::entries() const {
    return entries_;
  }

  std::vector<payment::SupportedKind> NetworkRegistry::supported() const {
    std::vector<payment::SupportedKind> kinds;
    kinds.reserve(entries_.size());
    for (const auto &entry : entries_) {
      kinds.push_back({payment::kX402Version, payment::kSchemeExact,
                       entry.network});
    }
    return kinds;
  }
}  // namespace x402::facilitator
