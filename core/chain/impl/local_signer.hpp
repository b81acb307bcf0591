/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "chain/signer.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace x402::chain {
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::Secp256k1Provider;

  enum class LocalSignerError {
    kCannotReadKeyFile = 1,
    kInvalidKey,
  };

  /**
   * Holds private key in memory, wipes it on destruction
   */
  class LocalSigner : public OperationalSigner {
   public:
    LocalSigner(std::shared_ptr<Secp256k1Provider> provider,
                const PrivateKey &key,
                const payment::Address &address);
    LocalSigner(const LocalSigner &) = delete;
    LocalSigner &operator=(const LocalSigner &) = delete;
    ~LocalSigner() override;

    static outcome::result<std::shared_ptr<LocalSigner>> make(
        std::shared_ptr<Secp256k1Provider> provider, const PrivateKey &key);

    /** Reads hex encoded key, "0x" prefix and surrounding whitespace allowed */
    static outcome::result<std::shared_ptr<LocalSigner>> fromFile(
        std::shared_ptr<Secp256k1Provider> provider, const std::string &path);

    const payment::Address &address() const override;

    outcome::result<crypto::secp256k1::Signature> sign(
        const common::Hash256 &digest) const override;

   private:
    std::shared_ptr<Secp256k1Provider> provider_;
    PrivateKey key_;
    payment::Address address_;
  };
}  // namespace x402::chain

OUTCOME_HPP_DECLARE_ERROR(x402::chain, LocalSignerError);
