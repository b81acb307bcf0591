/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>

#include "codec/json/coding.hpp"
#include "primitives/address/address.hpp"

namespace x402::primitives::address {

  /**
   * @brief Encodes an Address to "0x" prefixed EIP-55 checksummed string
   */
  std::string encodeToString(const Address &address);

  /**
   * @brief Decodes an Address from a string, "0x" prefix is optional.
   * Lowercase and uppercase forms are accepted as is, mixed case must carry a
   * valid EIP-55 checksum.
   */
  outcome::result<Address> decodeFromString(std::string_view s);

  JSON_ENCODE(Address) {
    return codec::json::encode(encodeToString(v), allocator);
  }

  JSON_DECODE(Address) {
    OUTCOME_EXCEPT(address, decodeFromString(codec::json::AsString(j)));
    v = address;
  }
}  // namespace x402::primitives::address

template <>
struct fmt::formatter<x402::primitives::address::Address>
    : formatter<std::string_view> {
  template <typename C>
  auto format(const x402::primitives::address::Address &address,
              C &ctx) const {
    auto str = x402::primitives::address::encodeToString(address);
    return formatter<std::string_view>::format(str, ctx);
  }
};
