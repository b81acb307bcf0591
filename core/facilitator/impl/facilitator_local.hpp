/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "facilitator/facilitator.hpp"
#include "facilitator/settlement_engine.hpp"

namespace x402::facilitator {

  /**
   * Facilitator backed by local verifier and settlement engine
   */
  class FacilitatorLocal : public Facilitator {
   public:
    FacilitatorLocal(std::shared_ptr<NetworkRegistry> registry,
                     std::shared_ptr<PaymentVerifier> verifier,
                     std::shared_ptr<SettlementEngine> engine,
                     std::shared_ptr<clock::UTCClock> clock,
                     bool check_balance);

    SupportedResponse supported() const override;

    void verify(const VerifyRequest &request,
                CbT<VerifyResponse> cb) override;

    void settle(const SettleRequest &request,
                CbT<SettleResponse> cb) override;

   private:
    std::shared_ptr<NetworkRegistry> registry_;
    std::shared_ptr<PaymentVerifier> verifier_;
    std::shared_ptr<SettlementEngine> engine_;
    std::shared_ptr<clock::UTCClock> clock_;
    bool check_balance_;
    common::Logger log_;
  };
}  // namespace x402::facilitator
