/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/local_signer.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <openssl/crypto.h>
#include <sstream>

namespace x402::chain {
  LocalSigner::LocalSigner(std::shared_ptr<Secp256k1Provider> provider,
                           const PrivateKey &key,
                           const payment::Address &address)
      : provider_{std::move(provider)}, key_{key}, address_{address} {}

  LocalSigner::~LocalSigner() {
    OPENSSL_cleanse(key_.data(), key_.size());
  }

  outcome::result<std::shared_ptr<LocalSigner>> LocalSigner::make(
      std::shared_ptr<Secp256k1Provider> provider, const PrivateKey &key) {
    auto public_key{provider->derive(key)};
    if (!public_key) {
      return LocalSignerError::kInvalidKey;
    }
    OUTCOME_TRY(address,
                payment::Address::makeFromPublicKey(public_key.value()));
    return std::make_shared<LocalSigner>(std::move(provider), key, address);
  }

  outcome::result<std::shared_ptr<LocalSigner>> LocalSigner::fromFile(
      std::shared_ptr<Secp256k1Provider> provider, const std::string &path) {
    std::ifstream file{path};
    if (!file.good()) {
      return LocalSignerError::kCannotReadKeyFile;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto text{buffer.str()};
    boost::algorithm::trim(text);
    auto blob{common::Blob<32>::fromHex(text)};
    OPENSSL_cleanse(text.data(), text.size());
    if (!blob) {
      return LocalSignerError::kInvalidKey;
    }
    PrivateKey key{blob.value()};
    auto signer{make(std::move(provider), key)};
    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(blob.value().data(), blob.value().size());
    return signer;
  }

  const payment::Address &LocalSigner::address() const {
    return address_;
  }

  outcome::result<crypto::secp256k1::Signature> LocalSigner::sign(
      const common::Hash256 &digest) const {
    return provider_->sign(digest, key_);
  }
}  // namespace x402::chain

OUTCOME_CPP_DEFINE_CATEGORY(x402::chain, LocalSignerError, e) {
  using E = x402::chain::LocalSignerError;
  switch (e) {
    case E::kCannotReadKeyFile:
      return "LocalSignerError: cannot read key file";
    case E::kInvalidKey:
      return "LocalSignerError: invalid private key";
  }
  return "LocalSignerError: unknown error";
}
