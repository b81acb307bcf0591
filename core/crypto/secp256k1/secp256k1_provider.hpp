/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gsl/span>
#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace x402::crypto::secp256k1 {

  /**
   * Secp256k1 operations over prehashed 32-byte messages, the way Ethereum
   * uses them:
   * - public key in uncompressed form
   * - signature in compact recoverable format
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Generate private and public keys
     * @return Secp256k1 key pair or error code
     */
    virtual outcome::result<KeyPair> generate() const = 0;

    /**
     * @brief Generate public key from private key
     * @param key - private key for deriving public key
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> derive(const PrivateKey &key) const = 0;

    /**
     * @brief Create recoverable signature for a message hash
     * @param message - 32 byte digest to sign
     * @param key - private key for signing
     * @return Secp256k1 signature with recovery id or error code
     */
    virtual outcome::result<Signature> sign(gsl::span<const uint8_t> message,
                                            const PrivateKey &key) const = 0;

    /**
     * RecoverPubkey returns the the public key of the signer.
     * @param message - signed 32 byte digest
     * @param signature - compact signature, recovery id in [0, 3]
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> recoverPublicKey(
        gsl::span<const uint8_t> message, const Signature &signature) const = 0;
  };

}  // namespace x402::crypto::secp256k1
