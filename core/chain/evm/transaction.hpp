/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "payment/types.hpp"

namespace x402::chain::evm {
  using payment::Address;
  using payment::UInt256;

  /**
   * Pre-EIP-2718 transaction with EIP-155 replay protection
   */
  struct LegacyTransaction {
    uint64_t nonce{};
    UInt256 gas_price;
    uint64_t gas_limit{};
    Address to;
    UInt256 value;
    Bytes data;
    uint64_t chain_id{};

    /** keccak256(rlp([nonce, gasPrice, gas, to, value, data, chainId, 0, 0]))
     */
    common::Hash256 signingHash() const;

    /**
     * Raw transaction for eth_sendRawTransaction
     * @param signature - compact signature with recovery id 0/1
     */
    Bytes encodeSigned(const crypto::secp256k1::Signature &signature) const;
  };

  /** Transaction hash of raw signed transaction */
  common::Hash256 transactionHash(BytesIn raw);
}  // namespace x402::chain::evm
