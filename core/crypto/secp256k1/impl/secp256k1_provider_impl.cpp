/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include "crypto/secp256k1/secp256k1_error.hpp"
#include "secp256k1_recovery.h"

namespace x402::crypto::secp256k1 {

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  outcome::result<KeyPair> Secp256k1ProviderImpl::generate() const {
    PrivateKey private_key{};
    std::shared_ptr<EC_KEY> key{EC_KEY_new_by_curve_name(NID_secp256k1),
                                EC_KEY_free};
    if (!key || EC_KEY_generate_key(key.get()) != 1) {
      return Secp256k1Error::kKeyGenerationFailed;
    }
    const BIGNUM *privateNum = EC_KEY_get0_private_key(key.get());
    if (BN_bn2binpad(privateNum, private_key.data(), private_key.size()) < 0) {
      return Secp256k1Error::kKeyGenerationFailed;
    }
    OUTCOME_TRY(public_key, derive(private_key));
    return KeyPair{private_key, public_key};
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::derive(
      const PrivateKey &key) const {
    secp256k1_pubkey pubkey;

    if (!secp256k1_ec_pubkey_create(context_.get(), &pubkey, key.data())) {
      return Secp256k1Error::kKeyGenerationFailed;
    }

    PublicKey public_key{};
    size_t outputlen = kPublicKeyUncompressedLength;
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       public_key.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }

    return public_key;
  }

  outcome::result<Signature> Secp256k1ProviderImpl::sign(
      gsl::span<const uint8_t> message, const PrivateKey &key) const {
    OUTCOME_TRY(checkMessage(message));
    secp256k1_ecdsa_recoverable_signature sig_struct;
    if (!secp256k1_ecdsa_sign_recoverable(context_.get(),
                                          &sig_struct,
                                          message.data(),
                                          key.data(),
                                          secp256k1_nonce_function_rfc6979,
                                          nullptr)) {
      return Secp256k1Error::kCannotSignError;
    }
    Signature signature{};
    int recid = 0;
    if (!secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), signature.data(), &recid, &sig_struct)) {
      return Secp256k1Error::kSignatureSerializationError;
    }
    signature[64] = static_cast<uint8_t>(recid);
    return signature;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::recoverPublicKey(
      gsl::span<const uint8_t> message, const Signature &signature) const {
    OUTCOME_TRY(checkMessage(message));
    if (signature[64] > 3) {
      return Secp256k1Error::kSignatureParseError;
    }

    secp256k1_ecdsa_recoverable_signature sig_rec;
    secp256k1_pubkey pubkey;

    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(
            context_.get(), &sig_rec, signature.data(), (int)signature[64])) {
      return Secp256k1Error::kSignatureParseError;
    }
    if (!secp256k1_ecdsa_recover(
            context_.get(), &pubkey, &sig_rec, message.data())) {
      return Secp256k1Error::kRecoverError;
    }
    PublicKey pubkey_out;
    size_t outputlen = kPublicKeyUncompressedLength;
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       pubkey_out.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }

    return pubkey_out;
  }

  outcome::result<void> Secp256k1ProviderImpl::checkMessage(
      gsl::span<const uint8_t> message) {
    if (message.size() != kMessageHashLength) {
      return Secp256k1Error::kSignatureParseError;
    }
    return outcome::success();
  }

}  // namespace x402::crypto::secp256k1
