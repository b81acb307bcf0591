/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace x402::crypto::keccak {
  using common::Hash256;

  /// Sponge rate of Keccak-256 in bytes (1600 - 2 * 256 bits)
  constexpr size_t kRate = 136;

  /**
   * Incremental Keccak-256 as used by Ethereum.
   * Padding is the original Keccak one (0x01), not the FIPS-202 SHA3 (0x06).
   */
  struct Ctx {
    void update(BytesIn in);
    Hash256 final();

    std::array<uint64_t, 25> state{};
    std::array<uint8_t, kRate> block{};
    size_t offset{};

   private:
    void absorb();
  };

  /**
   * @brief Get keccak-256 hash
   * @param to_hash - data to hash
   * @return hash
   */
  Hash256 keccak256(BytesIn to_hash);
}  // namespace x402::crypto::keccak
