/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include "crypto/keccak/keccak.hpp"

namespace x402::primitives::address {
  using crypto::keccak::keccak256;

  /// Uncompressed SEC1 prefix
  constexpr uint8_t kUncompressedTag = 0x04;

  outcome::result<Address> Address::makeFromPublicKey(
      const PublicKey &public_key) {
    if (public_key[0] != kUncompressedTag) {
      return AddressError::kInvalidPublicKey;
    }
    auto hash{keccak256(BytesIn{public_key}.subspan(1))};
    Address address;
    std::copy(hash.end() - address.size(), hash.end(), address.begin());
    return address;
  }

  bool Address::isZero() const {
    return std::all_of(begin(), end(), [](auto b) { return b == 0; });
  }
}  // namespace x402::primitives::address

OUTCOME_CPP_DEFINE_CATEGORY(x402::primitives::address, AddressError, e) {
  using x402::primitives::address::AddressError;
  switch (e) {
    case AddressError::kInvalidLength:
      return "AddressError: expected 20 bytes of hex";
    case AddressError::kInvalidChecksum:
      return "AddressError: mixed case address fails EIP-55 checksum";
    case AddressError::kInvalidPublicKey:
      return "AddressError: expected uncompressed public key";
    default:
      return "AddressError: unknown error";
  }
}
