/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/async.hpp"
#include "payment/types.hpp"

namespace x402::chain {
  using payment::Address;
  using payment::ExactEvmPayload;
  using payment::TxHash;
  using payment::UInt256;

  enum class TxStatus {
    kPending,
    kConfirmed,
    kReverted,
  };

  enum class ChainError {
    /// Transport failure, nothing known to reach the node
    kRpcUnavailable = 1,
    /// Node answered with JSON-RPC error
    kRpcError,
    /// Node answered with something that is not expected
    kBadResponse,
    /// Request was written, response never arrived
    kNoResponse,
    /// Rpc url is not http(s)://host[:port][/path]
    kInvalidUrl,
  };

  /**
   * Asynchronous access to one EVM chain
   */
  class ChainClient {
   public:
    virtual ~ChainClient() = default;

    /**
     * Submits transferWithAuthorization of `payload` to token `asset`, signed
     * and paid for by the operational signer
     * @param cb - transaction hash once it may have reached the node, even
     * when the node did not acknowledge it; error only if it was surely not
     * broadcast
     */
    virtual void submitTransfer(const Address &asset,
                                const ExactEvmPayload &payload,
                                CbT<TxHash> cb) = 0;

    virtual void getTxStatus(const TxHash &tx, CbT<TxStatus> cb) = 0;

    /** Token balance of `owner` */
    virtual void getBalance(const Address &owner,
                            const Address &asset,
                            CbT<UInt256> cb) = 0;
  };
}  // namespace x402::chain

OUTCOME_HPP_DECLARE_ERROR(x402::chain, ChainError);
