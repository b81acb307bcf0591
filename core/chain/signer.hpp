/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "payment/types.hpp"

namespace x402::chain {
  /**
   * Facilitator's own account that pays gas for settlements.
   * Key material never leaves the implementation.
   */
  class OperationalSigner {
   public:
    virtual ~OperationalSigner() = default;

    virtual const payment::Address &address() const = 0;

    /**
     * Signs 32 byte digest
     * @return compact signature with recovery id 0/1 in the last byte
     */
    virtual outcome::result<crypto::secp256k1::Signature> sign(
        const common::Hash256 &digest) const = 0;
  };
}  // namespace x402::chain
