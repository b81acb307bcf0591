/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"
#include "common/async.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "facilitator/network_registry.hpp"
#include "facilitator/replay_guard.hpp"

namespace x402::facilitator {
  using clock::UnixTime;
  using crypto::secp256k1::Secp256k1Provider;
  using payment::PaymentPayload;
  using payment::PaymentRequirements;
  using payment::Reason;
  using payment::VerifyResponse;

  /** Replay scope of payload */
  NonceKey nonceKey(const PaymentRequirements &requirements,
                    const PaymentPayload &payload);

  /**
   * Checks signed authorization against requirements.
   * No state is mutated, equal inputs give equal verdicts.
   */
  class PaymentVerifier {
   public:
    /**
     * @param skew - tolerance for `validAfter` of payer clock ahead of ours
     */
    PaymentVerifier(std::shared_ptr<NetworkRegistry> registry,
                    std::shared_ptr<ReplayGuard> replay_guard,
                    std::shared_ptr<Secp256k1Provider> secp,
                    std::chrono::seconds skew);

    /**
     * Every check except payer balance, in order: scheme, network, asset,
     * receiver, time window, value, signature, nonce
     */
    VerifyResponse check(const PaymentRequirements &requirements,
                         const PaymentPayload &payload,
                         UnixTime now) const;

    /**
     * `check` followed by optional balance lookup on chain
     * @param cb - verdict, or ChainError if balance lookup failed
     */
    void verify(const PaymentRequirements &requirements,
                const PaymentPayload &payload,
                UnixTime now,
                bool check_balance,
                CbT<VerifyResponse> cb) const;

   private:
    std::shared_ptr<NetworkRegistry> registry_;
    std::shared_ptr<ReplayGuard> replay_guard_;
    std::shared_ptr<Secp256k1Provider> secp_;
    std::chrono::seconds skew_;
  };
}  // namespace x402::facilitator
