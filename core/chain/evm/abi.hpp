/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "payment/types.hpp"

namespace x402::chain::evm::abi {
  using payment::Address;
  using payment::UInt256;

  constexpr auto kBalanceOf{"balanceOf(address)"};
  constexpr auto kTransferWithAuthorization{
      "transferWithAuthorization(address,address,uint256,uint256,uint256,"
      "bytes32,uint8,bytes32,bytes32)"};

  /** First 4 bytes of keccak256 of function signature */
  BytesN<4> selector(std::string_view signature);

  Bytes encodeBalanceOf(const Address &owner);

  /** Call data of EIP-3009 transferWithAuthorization with split v, r, s */
  Bytes encodeTransferWithAuthorization(
      const payment::ExactEvmPayload &payload);

  /** Decodes single static uint256 return value */
  outcome::result<UInt256> decodeUint256(BytesIn output);
}  // namespace x402::chain::evm::abi
