/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <mutex>

#include "chain/chain_client.hpp"
#include "chain/evm/json_rpc_client.hpp"
#include "chain/signer.hpp"
#include "common/ptr.hpp"

namespace x402::chain::evm {

  /**
   * ChainClient over Ethereum JSON-RPC.
   * Settlements are legacy EIP-155 transactions from the operational signer.
   */
  class EvmChainClient : public ChainClient,
                         public std::enable_shared_from_this<EvmChainClient> {
   public:
    EvmChainClient(std::shared_ptr<JsonRpcClient> rpc,
                   std::shared_ptr<OperationalSigner> signer,
                   uint64_t chain_id,
                   uint64_t gas_limit);

    void submitTransfer(const Address &asset,
                        const ExactEvmPayload &payload,
                        CbT<TxHash> cb) override;

    void getTxStatus(const TxHash &tx, CbT<TxStatus> cb) override;

    void getBalance(const Address &owner,
                    const Address &asset,
                    CbT<UInt256> cb) override;

   private:
    void sendTransfer(const Address &asset,
                      const ExactEvmPayload &payload,
                      uint64_t pending_count,
                      const UInt256 &gas_price,
                      CbT<TxHash> cb);

    /** Next account nonce, max of node pending count and local counter */
    uint64_t takeNonce(uint64_t pending_count);
    void resetNonce();

    std::shared_ptr<JsonRpcClient> rpc_;
    std::shared_ptr<OperationalSigner> signer_;
    uint64_t chain_id_;
    uint64_t gas_limit_;
    std::mutex nonce_mutex_;
    boost::optional<uint64_t> next_nonce_;
    common::Logger log_;
  };
}  // namespace x402::chain::evm
