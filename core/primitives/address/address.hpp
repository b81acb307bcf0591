/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace x402::primitives::address {
  using crypto::secp256k1::PublicKey;

  /**
   * @brief Potential errors creating and handling EVM addresses
   */
  enum class AddressError {
    kInvalidLength = 1, /**< Not 20 bytes of hex */
    kInvalidChecksum,   /**< Mixed case not matching EIP-55 */
    kInvalidPublicKey,  /**< Not an uncompressed secp256k1 key */
  };

  /**
   * @brief 20 byte account or contract address
   */
  struct Address : public common::Blob<20> {
    using Blob::Blob;

    Address() = default;
    explicit Address(const Blob<20> &blob) : Blob{blob} {}

    /// Last 20 bytes of keccak256 over the 64 byte public key body
    static outcome::result<Address> makeFromPublicKey(
        const PublicKey &public_key);

    bool isZero() const;
  };
}  // namespace x402::primitives::address

template <>
struct std::hash<x402::primitives::address::Address> {
  size_t operator()(const x402::primitives::address::Address &address) const {
    return std::hash<x402::common::Blob<20>>{}(address);
  }
};

/**
 * @brief Outcome errors declaration
 */
OUTCOME_HPP_DECLARE_ERROR(x402::primitives::address, AddressError);
