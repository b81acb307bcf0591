/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "facilitator/impl/facilitator_local.hpp"

namespace x402::facilitator {
  FacilitatorLocal::FacilitatorLocal(
      std::shared_ptr<NetworkRegistry> registry,
      std::shared_ptr<PaymentVerifier> verifier,
      std::shared_ptr<SettlementEngine> engine,
      std::shared_ptr<clock::UTCClock> clock,
      bool check_balance)
      : registry_{std::move(registry)},
        verifier_{std::move(verifier)},
        engine_{std::move(engine)},
        clock_{std::move(clock)},
        check_balance_{check_balance},
        log_{common::createLogger("facilitator")} {}

  SupportedResponse FacilitatorLocal::supported() const {
    return {registry_->supported()};
  }

  void FacilitatorLocal::verify(const VerifyRequest &request,
                                CbT<VerifyResponse> cb) {
    verifier_->verify(
        request.payment_requirements,
        request.payment_payload,
        clock_->nowUTC(),
        check_balance_,
        [log{log_}, cb{std::move(cb)}](outcome::result<VerifyResponse> _res) {
          if (_res && !_res.value().is_valid) {
            log->debug("verification failed: {}",
                       *_res.value().invalid_reason);
          }
          cb(std::move(_res));
        });
  }

  void FacilitatorLocal::settle(const SettleRequest &request,
                                CbT<SettleResponse> cb) {
    engine_->settle(
        request.payment_requirements, request.payment_payload, std::move(cb));
  }
}  // namespace x402::facilitator
