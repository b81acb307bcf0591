/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/types.hpp"

namespace x402::stream {
  std::string_view stateName(StreamState state) {
    switch (state) {
      case StreamState::kInit:
        return "init";
      case StreamState::kAwaitingPayment:
        return "awaiting_payment";
      case StreamState::kActive:
        return "active";
      case StreamState::kPaused:
        return "paused";
      case StreamState::kEnded:
        return "ended";
    }
    return "unknown";
  }

  outcome::result<StreamTerms> makeTerms(Network network,
                                         std::string_view price_per_unit,
                                         uint64_t unit_seconds,
                                         const Address &pay_to,
                                         std::string resource) {
    const auto &token{primitives::usdcDeployment(network)};
    StreamTerms terms;
    terms.network = network;
    terms.asset = token.address;
    terms.pay_to = pay_to;
    terms.price_per_unit = std::string{price_per_unit};
    OUTCOME_TRYA(terms.amount,
                 primitives::parseTokenAmount(price_per_unit, token.decimals));
    terms.unit_seconds = unit_seconds;
    terms.resource = std::move(resource);
    terms.extra = payment::TokenExtra{token.eip712_name, token.eip712_version};
    // unpaid part of a unit, so the grace never outlasts prepaid time
    terms.ttl = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds{unit_seconds} * (1 - terms.require_fraction));
    terms.keepalive_interval = std::chrono::seconds{5};
    return terms;
  }
}  // namespace x402::stream
