/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "payment/signature.hpp"

namespace x402::payment {
  constexpr uint8_t kEthVOffset = 27;

  outcome::result<Address> recoverSigner(const Secp256k1Provider &provider,
                                         const Hash256 &digest,
                                         const Signature &signature) {
    crypto::secp256k1::Signature compact;
    std::copy(signature.begin(), signature.end(), compact.begin());
    auto &v{compact[64]};
    if (v >= kEthVOffset) {
      v -= kEthVOffset;
    }
    if (v > 1) {
      return SignatureError::kInvalidRecoveryId;
    }
    OUTCOME_TRY(public_key, provider.recoverPublicKey(digest, compact));
    return Address::makeFromPublicKey(public_key);
  }

  Signature toEthSignature(const crypto::secp256k1::Signature &signature) {
    Signature eth{signature};
    eth[64] = static_cast<uint8_t>(eth[64] + kEthVOffset);
    return eth;
  }
}  // namespace x402::payment

OUTCOME_CPP_DEFINE_CATEGORY(x402::payment, SignatureError, e) {
  using x402::payment::SignatureError;
  switch (e) {
    case SignatureError::kInvalidRecoveryId:
      return "SignatureError: recovery id must be 0, 1, 27 or 28";
  }
  return "SignatureError: unknown error";
}
