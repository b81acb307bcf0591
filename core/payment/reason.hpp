/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>
#include <string_view>

#include "codec/json/coding.hpp"

namespace x402::payment {

  /**
   * @brief Why a payment was refused or a settlement failed, snake_case on
   * the wire
   */
  enum class Reason {
    kSchemeMismatch,
    kNetworkMismatch,
    kAssetMismatch,
    kReceiverMismatch,
    kNotYetValid,
    kExpired,
    kInsufficientValue,
    kInvalidSignature,
    kNonceReused,
    kInsufficientBalance,
    kInvalidWindow,
    kInvalidPayload,
    kTxReverted,
    kRpcUnavailable,
    kTxTimeout,
  };

  /**
   * @brief How a caller should treat a settlement failure
   */
  enum class FaultClass {
    /// Payload is refused, nothing was submitted
    kRejected,
    /// Nothing reached the chain, same payload may be settled again
    kRetryable,
    /// Payload must be discarded
    kFatal,
    /// Outcome unknown until reconciled
    kAmbiguous,
  };

  std::string_view reasonName(Reason reason);

  outcome::result<Reason> reasonFromName(std::string_view name);

  FaultClass classify(Reason reason);

  JSON_ENCODE(Reason) {
    return codec::json::encode(reasonName(v), allocator);
  }

  JSON_DECODE(Reason) {
    auto reason{reasonFromName(codec::json::AsString(j))};
    if (!reason) {
      outcome::raise(codec::json::JsonError::kWrongEnum);
    }
    v = reason.value();
  }
}  // namespace x402::payment

template <>
struct fmt::formatter<x402::payment::Reason> : formatter<std::string_view> {
  template <typename C>
  auto format(const x402::payment::Reason &reason, C &ctx) const {
    return formatter<std::string_view>::format(
        x402::payment::reasonName(reason), ctx);
  }
};
