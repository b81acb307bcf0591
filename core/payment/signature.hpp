/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "payment/types.hpp"

namespace x402::payment {
  using crypto::secp256k1::Secp256k1Provider;

  enum class SignatureError {
    kInvalidRecoveryId = 1,
  };

  /**
   * Recovers the address that produced an Ethereum signature over `digest`
   * @param signature - r || s || v, v is 27/28 or 0/1
   */
  outcome::result<Address> recoverSigner(const Secp256k1Provider &provider,
                                         const Hash256 &digest,
                                         const Signature &signature);

  /**
   * Converts compact recoverable signature to Ethereum form with v = 27 + id
   */
  Signature toEthSignature(const crypto::secp256k1::Signature &signature);
}  // namespace x402::payment

OUTCOME_HPP_DECLARE_ERROR(x402::payment, SignatureError);
