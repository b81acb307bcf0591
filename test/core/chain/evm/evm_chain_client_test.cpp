/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/evm/evm_chain_client.hpp"

#include <gtest/gtest.h>

#include "chain/evm/transaction.hpp"
#include "chain/impl/local_signer.hpp"
#include "common/hexutil.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/chain/json_rpc_client_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/payment/test_payer.hpp"

namespace x402::chain::evm {
  using payment::makeNonce;
  using payment::makeRequirements;
  using payment::TestPayer;
  using testing::_;

  class EvmChainClientTest : public testing::Test {
   public:
    void SetUp() override {
      PrivateKey key{};
      key[31] = 7;
      signer = LocalSigner::make(payer.secp, key).value();
      client =
          std::make_shared<EvmChainClient>(rpc, signer, 84532, 150000);
      auto requirements{makeRequirements(
          payment::Network::kBaseSepolia,
          10000,
          "0x209693Bc6afc0C5328bA36FaF03C514EF312287C"_address)};
      asset = requirements.asset;
      payload = payer.pay(requirements, 1740672100, makeNonce(1)).payload;

      EXPECT_CALL(*rpc, request("eth_getTransactionCount", _, _))
          .WillOnce(testing::Invoke([](auto &, auto &, CbT<Document> cb) {
            cb(codec::json::parse(R"("0x5")"));
          }));
      EXPECT_CALL(*rpc, request("eth_gasPrice", _, _))
          .WillOnce(testing::Invoke([](auto &, auto &, CbT<Document> cb) {
            cb(codec::json::parse(R"("0x3b9aca00")"));
          }));
    }

    /**
     * Answers eth_sendRawTransaction with `reply`, remembers hash of the
     * submitted raw transaction
     */
    void expectSend(std::function<outcome::result<Document>(TxHash)> reply) {
      EXPECT_CALL(*rpc, request("eth_sendRawTransaction", _, _))
          .WillOnce(testing::Invoke(
              [this, reply](auto &, const Document &params, CbT<Document> cb) {
                auto raw{common::unhex(params[0].GetString()).value()};
                sent = transactionHash(raw);
                cb(reply(*sent));
              }));
    }

    outcome::result<TxHash> submit() {
      boost::optional<outcome::result<TxHash>> result;
      client->submitTransfer(
          asset, payload, [&](outcome::result<TxHash> _tx) { result = _tx; });
      EXPECT_TRUE(result);
      if (!result) {
        return ChainError::kRpcUnavailable;
      }
      return *result;
    }

    io_context io;
    std::shared_ptr<JsonRpcClientMock> rpc{
        std::make_shared<JsonRpcClientMock>(io)};
    TestPayer payer{1};
    std::shared_ptr<LocalSigner> signer;
    std::shared_ptr<EvmChainClient> client;
    Address asset;
    payment::ExactEvmPayload payload;
    boost::optional<TxHash> sent;
  };

  /**
   * @given node acknowledging raw transaction with its hash
   * @when submitting transfer
   * @then hash of the signed transaction
   */
  TEST_F(EvmChainClientTest, Acknowledged) {
    expectSend([](const TxHash &hash) {
      return codec::json::parse("\"" + hash.toHex0x() + "\"");
    });
    EXPECT_OUTCOME_TRUE(tx, submit());
    ASSERT_TRUE(sent);
    EXPECT_EQ(tx, *sent);
  }

  /**
   * @given raw transaction written, response lost
   * @when submitting transfer
   * @then hash of the signed transaction, outcome is left to receipt polling
   */
  TEST_F(EvmChainClientTest, ResponseLostAfterSend) {
    expectSend([](const TxHash &) { return ChainError::kNoResponse; });
    EXPECT_OUTCOME_TRUE(tx, submit());
    ASSERT_TRUE(sent);
    EXPECT_EQ(tx, *sent);
  }

  /**
   * @given node answering with different hash
   * @when submitting transfer
   * @then hash of the signed transaction
   */
  TEST_F(EvmChainClientTest, UnexpectedHash) {
    expectSend([](const TxHash &) {
      return codec::json::parse(
          R"("0x1111111111111111111111111111111111111111111111111111111111111111")");
    });
    EXPECT_OUTCOME_TRUE(tx, submit());
    ASSERT_TRUE(sent);
    EXPECT_EQ(tx, *sent);
  }

  /**
   * @given node rejecting raw transaction with JSON-RPC error
   * @when submitting transfer
   * @then error, transaction surely not broadcast
   */
  TEST_F(EvmChainClientTest, Rejected) {
    expectSend([](const TxHash &) { return ChainError::kRpcError; });
    EXPECT_OUTCOME_ERROR(ChainError::kRpcError, submit());
  }
}  // namespace x402::chain::evm
