/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/evm/evm_chain_client.hpp"

#include "chain/evm/abi.hpp"
#include "chain/evm/transaction.hpp"
#include "codec/json/coding.hpp"
#include "primitives/address/address_codec.hpp"

#define MOVE(x)  \
  x {            \
    std::move(x) \
  }

namespace x402::chain::evm {
  using codec::json::Set;
  using codec::json::Value;
  using common::hex0x;

  namespace {
    Document array() {
      return Document{rapidjson::kArrayType};
    }

    void push(Document &params, std::string_view value) {
      params.PushBack(codec::json::encode(value, params.GetAllocator()),
                      params.GetAllocator());
    }

    /** Hex string result to bytes */
    outcome::result<Bytes> hexResult(const Document &doc) {
      if (!doc.IsString()) {
        return ChainError::kBadResponse;
      }
      auto bytes{common::unhex({doc.GetString(), doc.GetStringLength()})};
      if (!bytes) {
        return ChainError::kBadResponse;
      }
      return std::move(bytes.value());
    }

    outcome::result<UInt256> quantityResult(const Document &doc) {
      if (!doc.IsString()) {
        return ChainError::kBadResponse;
      }
      auto value{
          primitives::parseQuantity({doc.GetString(), doc.GetStringLength()})};
      if (!value) {
        return ChainError::kBadResponse;
      }
      return value.value();
    }
  }  // namespace

  EvmChainClient::EvmChainClient(std::shared_ptr<JsonRpcClient> rpc,
                                 std::shared_ptr<OperationalSigner> signer,
                                 uint64_t chain_id,
                                 uint64_t gas_limit)
      : rpc_{std::move(rpc)},
        signer_{std::move(signer)},
        chain_id_{chain_id},
        gas_limit_{gas_limit},
        log_{common::createLogger("evm")} {}

  void EvmChainClient::submitTransfer(const Address &asset,
                                      const ExactEvmPayload &payload,
                                      CbT<TxHash> cb) {
    auto params{array()};
    push(params, primitives::address::encodeToString(signer_->address()));
    push(params, "pending");
    rpc_->call(
        "eth_getTransactionCount",
        std::move(params),
        weakCb(*this,
               [asset, payload, MOVE(cb)](auto &&self,
                                          outcome::result<Document> _count) {
                 OUTCOME_CB(auto count_doc, _count);
                 OUTCOME_CB(auto count, quantityResult(count_doc));
                 self->rpc_->call(
                     "eth_gasPrice",
                     array(),
                     weakCb(*self,
                            [asset, payload, count, MOVE(cb)](
                                auto &&self,
                                outcome::result<Document> _price) {
                              OUTCOME_CB(auto price_doc, _price);
                              OUTCOME_CB(auto gas_price,
                                         quantityResult(price_doc));
                              self->sendTransfer(
                                  asset,
                                  payload,
                                  count.convert_to<uint64_t>(),
                                  gas_price,
                                  std::move(cb));
                            }));
               }));
  }

  void EvmChainClient::sendTransfer(const Address &asset,
                                    const ExactEvmPayload &payload,
                                    uint64_t pending_count,
                                    const UInt256 &gas_price,
                                    CbT<TxHash> cb) {
    LegacyTransaction tx;
    tx.nonce = takeNonce(pending_count);
    tx.gas_price = gas_price;
    tx.gas_limit = gas_limit_;
    tx.to = asset;
    tx.data = abi::encodeTransferWithAuthorization(payload);
    tx.chain_id = chain_id_;
    auto _sig{signer_->sign(tx.signingHash())};
    if (!_sig) {
      resetNonce();
      return cb(_sig.error());
    }
    auto raw{tx.encodeSigned(_sig.value())};
    auto expected{transactionHash(raw)};

    auto send{array()};
    push(send, hex0x(raw));
    rpc_->call(
        "eth_sendRawTransaction",
        std::move(send),
        weakCb(*this,
               [expected, MOVE(cb)](auto &&self,
                                    outcome::result<Document> _hash) {
                 if (!_hash) {
                   self->resetNonce();
                   const auto &error{_hash.error()};
                   if (error == ChainError::kRpcUnavailable
                       || error == ChainError::kRpcError) {
                     return cb(error);
                   }
                   // transaction may be in mempool, track it by own hash
                   self->log_->warn("no acknowledgement of {}: {}",
                                    expected.toHex0x(),
                                    error.message());
                   return cb(expected);
                 }
                 auto acknowledged{false};
                 if (auto _bytes{hexResult(_hash.value())}) {
                   auto _tx{TxHash::fromSpan(_bytes.value())};
                   acknowledged = _tx && _tx.value() == expected;
                 }
                 if (!acknowledged) {
                   self->log_->warn("node returned unexpected hash for {}",
                                    expected.toHex0x());
                 }
                 cb(expected);
               }));
  }

  void EvmChainClient::getTxStatus(const TxHash &tx, CbT<TxStatus> cb) {
    auto params{array()};
    push(params, tx.toHex0x());
    rpc_->call("eth_getTransactionReceipt",
               std::move(params),
               [MOVE(cb)](outcome::result<Document> _receipt) {
                 OUTCOME_CB(auto receipt, _receipt);
                 if (receipt.IsNull()) {
                   return cb(TxStatus::kPending);
                 }
                 if (!receipt.IsObject()) {
                   return cb(ChainError::kBadResponse);
                 }
                 auto it{receipt.FindMember("status")};
                 if (it == receipt.MemberEnd() || !it->value.IsString()) {
                   return cb(ChainError::kBadResponse);
                 }
                 std::string_view status{it->value.GetString(),
                                         it->value.GetStringLength()};
                 cb(status == "0x1" ? TxStatus::kConfirmed
                                    : TxStatus::kReverted);
               });
  }

  void EvmChainClient::getBalance(const Address &owner,
                                  const Address &asset,
                                  CbT<UInt256> cb) {
    auto params{array()};
    auto &allocator{params.GetAllocator()};
    Value call{rapidjson::kObjectType};
    Set(call,
        "to",
        primitives::address::encodeToString(asset),
        allocator);
    Set(call, "data", hex0x(abi::encodeBalanceOf(owner)), allocator);
    params.PushBack(call, allocator);
    push(params, "latest");
    rpc_->call("eth_call",
               std::move(params),
               [MOVE(cb)](outcome::result<Document> _output) {
                 OUTCOME_CB(auto output, _output);
                 OUTCOME_CB(auto bytes, hexResult(output));
                 cb(abi::decodeUint256(bytes));
               });
  }

  uint64_t EvmChainClient::takeNonce(uint64_t pending_count) {
    std::lock_guard lock{nonce_mutex_};
    auto nonce{std::max(pending_count, next_nonce_.value_or(0))};
    next_nonce_ = nonce + 1;
    return nonce;
  }

  void EvmChainClient::resetNonce() {
    std::lock_guard lock{nonce_mutex_};
    next_nonce_.reset();
  }
}  // namespace x402::chain::evm
