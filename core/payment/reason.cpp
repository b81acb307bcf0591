/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "payment/reason.hpp"

#include <array>
#include <utility>

namespace x402::payment {
  namespace {
    using Entry = std::pair<Reason, std::string_view>;

    constexpr std::array<Entry, 15> kNames{{
        {Reason::kSchemeMismatch, "scheme_mismatch"},
        {Reason::kNetworkMismatch, "network_mismatch"},
        {Reason::kAssetMismatch, "asset_mismatch"},
        {Reason::kReceiverMismatch, "receiver_mismatch"},
        {Reason::kNotYetValid, "not_yet_valid"},
        {Reason::kExpired, "expired"},
        {Reason::kInsufficientValue, "insufficient_value"},
        {Reason::kInvalidSignature, "invalid_signature"},
        {Reason::kNonceReused, "nonce_reused"},
        {Reason::kInsufficientBalance, "insufficient_balance"},
        {Reason::kInvalidWindow, "invalid_window"},
        {Reason::kInvalidPayload, "invalid_payload"},
        {Reason::kTxReverted, "tx_reverted"},
        {Reason::kRpcUnavailable, "rpc_unavailable"},
        {Reason::kTxTimeout, "tx_timeout"},
    }};
  }  // namespace

  std::string_view reasonName(Reason reason) {
    for (const auto &[r, name] : kNames) {
      if (r == reason) {
        return name;
      }
    }
    return "unknown";
  }

  outcome::result<Reason> reasonFromName(std::string_view name) {
    for (const auto &[r, n] : kNames) {
      if (n == name) {
        return r;
      }
    }
    return codec::json::JsonError::kWrongEnum;
  }

  FaultClass classify(Reason reason) {
    switch (reason) {
      case Reason::kRpcUnavailable:
        return FaultClass::kRetryable;
      case Reason::kTxReverted:
        return FaultClass::kFatal;
      case Reason::kTxTimeout:
        return FaultClass::kAmbiguous;
      default:
        return FaultClass::kRejected;
    }
  }
}  // namespace x402::payment
