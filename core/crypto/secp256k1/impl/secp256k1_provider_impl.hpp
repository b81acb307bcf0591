/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "secp256k1.h"

namespace x402::crypto::secp256k1 {

  /**
   * Implemetation of Secp256k1 provider over libsecp256k1
   * - NO digest function, messages are expected to be hashed by the caller
   */
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    outcome::result<KeyPair> generate() const override;

    outcome::result<PublicKey> derive(const PrivateKey &key) const override;

    outcome::result<Signature> sign(gsl::span<const uint8_t> message,
                                    const PrivateKey &key) const override;

    outcome::result<PublicKey> recoverPublicKey(
        gsl::span<const uint8_t> message,
        const Signature &signature) const override;

   private:
    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;

    static outcome::result<void> checkMessage(
        gsl::span<const uint8_t> message);
  };

}  // namespace x402::crypto::secp256k1
