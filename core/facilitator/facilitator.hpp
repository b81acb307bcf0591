/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/async.hpp"
#include "payment/types.hpp"

namespace x402::facilitator {
  using payment::SettleRequest;
  using payment::SettleResponse;
  using payment::SupportedResponse;
  using payment::VerifyRequest;
  using payment::VerifyResponse;

  /**
   * Verification and settlement of x402 "exact" payments.
   * Business failures are reported in responses, errors mean the facilitator
   * could not reach a verdict.
   */
  class Facilitator {
   public:
    virtual ~Facilitator() = default;

    virtual SupportedResponse supported() const = 0;

    virtual void verify(const VerifyRequest &request,
                        CbT<VerifyResponse> cb) = 0;

    virtual void settle(const SettleRequest &request,
                        CbT<SettleResponse> cb) = 0;
  };
}  // namespace x402::facilitator
