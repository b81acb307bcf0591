/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address_codec.hpp"

#include <cctype>

#include "common/span.hpp"
#include "crypto/keccak/keccak.hpp"

namespace x402::primitives::address {
  using crypto::keccak::keccak256;

  namespace {
    /// Nibble of checksum hash that decides case of hex digit at `i`
    uint8_t checksumNibble(const common::Hash256 &hash, size_t i) {
      auto byte{hash[i / 2]};
      return i % 2 == 0 ? byte >> 4 : byte & 0x0f;
    }
  }  // namespace

  std::string encodeToString(const Address &address) {
    auto hex{address.toHex()};
    auto hash{keccak256(common::span::cbytes(hex))};
    for (size_t i = 0; i < hex.size(); ++i) {
      if (std::isalpha(static_cast<unsigned char>(hex[i]))
          && checksumNibble(hash, i) >= 8) {
        hex[i] = static_cast<char>(
            std::toupper(static_cast<unsigned char>(hex[i])));
      }
    }
    return "0x" + hex;
  }

  outcome::result<Address> decodeFromString(std::string_view s) {
    auto hex{common::strip0x(s)};
    if (hex.size() != Address::size() * 2) {
      return AddressError::kInvalidLength;
    }
    auto blob{common::Blob<20>::fromHex(hex)};
    if (!blob) {
      return AddressError::kInvalidLength;
    }
    Address address{blob.value()};

    bool has_lower{false};
    bool has_upper{false};
    for (auto c : hex) {
      has_lower |= c >= 'a' && c <= 'f';
      has_upper |= c >= 'A' && c <= 'F';
    }
    if (has_lower && has_upper && encodeToString(address).substr(2) != hex) {
      return AddressError::kInvalidChecksum;
    }
    return address;
  }
}  // namespace x402::primitives::address
