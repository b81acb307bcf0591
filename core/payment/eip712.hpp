/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "payment/types.hpp"

namespace x402::payment::eip712 {

  /**
   * EIP712Domain(string name,string version,uint256 chainId,
   * address verifyingContract)
   */
  struct Domain {
    std::string name;
    std::string version;
    uint64_t chain_id{};
    Address verifying_contract;
  };

  Hash256 domainSeparator(const Domain &domain);

  /// hashStruct of TransferWithAuthorization
  Hash256 structHash(const Authorization &authorization);

  /**
   * @brief Digest signed by the payer: keccak256(0x1901 || domainSeparator ||
   * structHash)
   */
  Hash256 digest(const Domain &domain, const Authorization &authorization);
}  // namespace x402::payment::eip712
