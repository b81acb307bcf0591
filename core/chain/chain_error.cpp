/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_client.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(x402::chain, ChainError, e) {
  using E = x402::chain::ChainError;
  switch (e) {
    case E::kRpcUnavailable:
      return "ChainError: rpc unavailable";
    case E::kRpcError:
      return "ChainError: rpc returned error";
    case E::kBadResponse:
      return "ChainError: unexpected rpc response";
    case E::kNoResponse:
      return "ChainError: request sent, no response";
    case E::kInvalidUrl:
      return "ChainError: invalid rpc url";
  }
  return "ChainError: unknown error";
}
