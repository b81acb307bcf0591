/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "facilitator/settlement_engine.hpp"

#include <gtest/gtest.h>

#include "chain/evm/evm_chain_client.hpp"
#include "chain/evm/transaction.hpp"
#include "chain/impl/local_signer.hpp"
#include "common/hexutil.hpp"
#include "testutil/facilitator/registry.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/chain/json_rpc_client_mock.hpp"
#include "testutil/mocks/clock/utc_clock_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/payment/test_payer.hpp"

namespace x402::facilitator {
  using chain::ChainClientMock;
  using chain::ChainError;
  using chain::TxStatus;
  using chain::evm::Document;
  using chain::evm::JsonRpcClientMock;
  using clock::UTCClockMock;
  using payment::ExactEvmPayload;
  using payment::makeNonce;
  using payment::makeRequirements;
  using payment::TestPayer;
  using testing::_;

  constexpr uint64_t kNow{1740672100};

  class SettlementEngineTest : public testing::Test {
   public:
    void SetUp() override {
      ON_CALL(*clock, nowMicro()).WillByDefault(testing::Invoke([this] {
        return std::chrono::duration_cast<clock::microseconds>(now);
      }));
      requirements = makeRequirements(
          Network::kBaseSepolia,
          10000,
          "0x209693Bc6afc0C5328bA36FaF03C514EF312287C"_address);
      payload = payer.pay(requirements, kNow, makeNonce(1));

      auto registry{makeRegistry(client)};
      auto verifier{std::make_shared<PaymentVerifier>(
          registry, guard, payer.secp, std::chrono::seconds{6})};
      engine = std::make_shared<SettlementEngine>(
          io, verifier, registry, guard, clock, std::chrono::milliseconds{1});
    }

    void expectSubmit(outcome::result<TxHash> result) {
      EXPECT_CALL(*client, submitTransfer(requirements.asset, _, _))
          .WillOnce(testing::Invoke(
              [result](auto &, const ExactEvmPayload &, CbT<TxHash> cb) {
                cb(result);
              }));
    }

    SettleResponse settle() {
      boost::optional<SettleResponse> response;
      engine->settle(requirements, payload, [&](auto _res) {
        ASSERT_TRUE(_res);
        response = _res.value();
      });
      io.restart();
      io.run();
      EXPECT_TRUE(response);
      return response.value_or(SettleResponse{});
    }

    size_t reconcile() {
      boost::optional<size_t> resolved;
      engine->reconcile([&](size_t n) { resolved = n; });
      io.restart();
      io.run();
      EXPECT_TRUE(resolved);
      return resolved.value_or(0);
    }

    NonceKey key() const {
      return nonceKey(requirements, payload);
    }

    const TxHash tx{
        "0x2222222222222222222222222222222222222222222222222222222222222222"_hash256};
    io_context io;
    std::chrono::milliseconds now{kNow * 1000};
    std::shared_ptr<UTCClockMock> clock{
        std::make_shared<testing::NiceMock<UTCClockMock>>()};
    std::shared_ptr<ChainClientMock> client{
        std::make_shared<ChainClientMock>()};
    std::shared_ptr<ReplayGuard> guard{std::make_shared<ReplayGuard>()};
    TestPayer payer{1};
    PaymentRequirements requirements;
    PaymentPayload payload;
    std::shared_ptr<SettlementEngine> engine;
  };

  /**
   * @given valid payload and transaction confirmed on first receipt query
   * @when settling
   * @then success with transaction hash, nonce committed
   */
  TEST_F(SettlementEngineTest, Confirmed) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));
    auto response{settle()};
    EXPECT_TRUE(response.success);
    EXPECT_TRUE(response.transaction == tx);
    EXPECT_TRUE(response.payer == payer.address);
    EXPECT_EQ(response.network, Network::kBaseSepolia);
    EXPECT_FALSE(response.error_reason);
    EXPECT_TRUE(guard->isCommitted(key()));
  }

  /**
   * @given receipt missing on first queries
   * @when settling
   * @then engine keeps polling until confirmed
   */
  TEST_F(SettlementEngineTest, PollsUntilConfirmed) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kPending); }))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(ChainError::kRpcUnavailable); }))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));
    EXPECT_TRUE(settle().success);
    EXPECT_TRUE(guard->isCommitted(key()));
  }

  /**
   * @given settled payload
   * @when settling same payload again
   * @then nonce_reused without submission
   */
  TEST_F(SettlementEngineTest, SettleTwice) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));
    EXPECT_TRUE(settle().success);
    auto again{settle()};
    EXPECT_FALSE(again.success);
    EXPECT_TRUE(again.error_reason == Reason::kNonceReused);
  }

  /**
   * @given transaction reverted
   * @when settling, then settling same payload again
   * @then tx_reverted, nonce free, payload discarded without resubmission
   */
  TEST_F(SettlementEngineTest, Reverted) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kReverted); }));
    auto response{settle()};
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.error_reason == Reason::kTxReverted);
    EXPECT_TRUE(response.transaction == tx);
    EXPECT_FALSE(guard->isTaken(key()));
    EXPECT_TRUE(engine->isDiscarded(key(), payer.address));

    auto again{settle()};
    EXPECT_TRUE(again.error_reason == Reason::kTxReverted);
    EXPECT_FALSE(again.transaction);
  }

  /**
   * @given reverted payload
   * @when settling it again with recovery id 27 rewritten as 0
   * @then tx_reverted without resubmission
   */
  TEST_F(SettlementEngineTest, RevertedWithRewrittenRecoveryId) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kReverted); }));
    EXPECT_TRUE(settle().error_reason == Reason::kTxReverted);

    auto &v{payload.payload.signature[64]};
    v = v >= 27 ? v - 27 : v + 27;
    auto again{settle()};
    EXPECT_FALSE(again.success);
    EXPECT_TRUE(again.error_reason == Reason::kTxReverted);
    EXPECT_FALSE(again.transaction);
  }

  /**
   * @given node unreachable on submission
   * @when settling, then retrying after node recovers
   * @then rpc_unavailable with nonce released, retry succeeds
   */
  TEST_F(SettlementEngineTest, RpcUnavailable) {
    expectSubmit(ChainError::kRpcUnavailable);
    auto response{settle()};
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.error_reason == Reason::kRpcUnavailable);
    EXPECT_FALSE(guard->isTaken(key()));

    testing::Mock::VerifyAndClearExpectations(client.get());
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));
    EXPECT_TRUE(settle().success);
  }

  /**
   * @given payload failing verification
   * @when settling
   * @then verification reason, nothing submitted or reserved
   */
  TEST_F(SettlementEngineTest, InvalidPayload) {
    EXPECT_CALL(*client, submitTransfer(_, _, _)).Times(0);
    payload.payload.authorization.value = 1;
    auto response{settle()};
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.error_reason == Reason::kInsufficientValue);
    EXPECT_FALSE(guard->isTaken(key()));

    now += std::chrono::minutes{5};
    payload = payer.pay(requirements, kNow, makeNonce(2));
    EXPECT_TRUE(settle().error_reason == Reason::kExpired);
  }

  /**
   * @given first settlement of nonce still in flight
   * @when second settlement of same nonce arrives
   * @then second gets nonce_reused, first completes
   */
  TEST_F(SettlementEngineTest, ConcurrentSameNonce) {
    CbT<TxHash> submitted;
    EXPECT_CALL(*client, submitTransfer(_, _, _))
        .WillOnce(testing::Invoke(
            [&](auto &, const ExactEvmPayload &, CbT<TxHash> cb) {
              submitted = std::move(cb);
            }));
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));

    boost::optional<SettleResponse> first;
    engine->settle(requirements, payload, [&](auto _res) {
      first = _res.value();
    });
    EXPECT_FALSE(first);

    auto second{settle()};
    EXPECT_TRUE(second.error_reason == Reason::kNonceReused);

    ASSERT_TRUE(submitted);
    submitted(tx);
    ASSERT_TRUE(first);
    EXPECT_TRUE(first->success);
  }

  /**
   * @given receipt not available before maxTimeoutSeconds
   * @when settling
   * @then tx_timeout, nonce kept pending, same payload refused
   */
  TEST_F(SettlementEngineTest, Timeout) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillRepeatedly(testing::Invoke([this](auto &, CbT<TxStatus> cb) {
          now += std::chrono::seconds{20};
          cb(TxStatus::kPending);
        }));
    auto response{settle()};
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.error_reason == Reason::kTxTimeout);
    EXPECT_TRUE(response.transaction == tx);
    EXPECT_TRUE(guard->isTaken(key()));
    ASSERT_EQ(guard->pending().size(), 1);
    EXPECT_EQ(guard->pending()[0].tx, tx);

    now = std::chrono::milliseconds{kNow * 1000};
    EXPECT_TRUE(settle().error_reason == Reason::kNonceReused);
  }

  /**
   * @given node that took the raw transaction but never replied, receipt
   * unknown until maxTimeoutSeconds
   * @when settling, then settling same payload again
   * @then tx_timeout with hash of the sent transaction, nonce kept pending,
   * nothing resubmitted
   */
  TEST_F(SettlementEngineTest, SentWithoutAcknowledgement) {
    auto rpc{std::make_shared<JsonRpcClientMock>(io)};
    crypto::secp256k1::PrivateKey operator_key{};
    operator_key[31] = 7;
    auto evm{std::make_shared<chain::evm::EvmChainClient>(
        rpc,
        chain::LocalSigner::make(payer.secp, operator_key).value(),
        primitives::chainId(Network::kBaseSepolia),
        150000)};
    auto registry{std::make_shared<NetworkRegistry>(
        std::vector<NetworkEntry>{makeEntry(Network::kBaseSepolia, evm)})};
    engine = std::make_shared<SettlementEngine>(
        io,
        std::make_shared<PaymentVerifier>(
            registry, guard, payer.secp, std::chrono::seconds{6}),
        registry,
        guard,
        clock,
        std::chrono::milliseconds{1});

    boost::optional<TxHash> sent;
    EXPECT_CALL(*rpc, request("eth_getTransactionCount", _, _))
        .WillOnce(testing::Invoke([](auto &, auto &, CbT<Document> cb) {
          cb(codec::json::parse(R"("0x5")"));
        }));
    EXPECT_CALL(*rpc, request("eth_gasPrice", _, _))
        .WillOnce(testing::Invoke([](auto &, auto &, CbT<Document> cb) {
          cb(codec::json::parse(R"("0x3b9aca00")"));
        }));
    EXPECT_CALL(*rpc, request("eth_sendRawTransaction", _, _))
        .WillOnce(testing::Invoke(
            [&](auto &, const Document &params, CbT<Document> cb) {
              auto raw{common::unhex(params[0].GetString()).value()};
              sent = chain::evm::transactionHash(raw);
              cb(ChainError::kNoResponse);
            }));
    EXPECT_CALL(*rpc, request("eth_getTransactionReceipt", _, _))
        .WillRepeatedly(
            testing::Invoke([this](auto &, auto &, CbT<Document> cb) {
              now += std::chrono::seconds{20};
              cb(codec::json::parse("null"));
            }));

    auto response{settle()};
    ASSERT_TRUE(sent);
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.error_reason == Reason::kTxTimeout);
    EXPECT_TRUE(response.transaction == sent);
    ASSERT_EQ(guard->pending().size(), 1);
    EXPECT_EQ(guard->pending()[0].tx, *sent);

    now = std::chrono::milliseconds{kNow * 1000};
    EXPECT_TRUE(settle().error_reason == Reason::kNonceReused);
  }

  /**
   * @given committed and discarded authorizations
   * @when pruning before and after their validBefore
   * @then kept while valid, forgotten once expired
   */
  TEST_F(SettlementEngineTest, PruneExpired) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));
    EXPECT_TRUE(settle().success);
    auto committed{key()};

    payload = payer.pay(requirements, kNow, makeNonce(2));
    const TxHash reverted_tx{
        "0x3333333333333333333333333333333333333333333333333333333333333333"_hash256};
    testing::Mock::VerifyAndClearExpectations(client.get());
    expectSubmit(reverted_tx);
    EXPECT_CALL(*client, getTxStatus(reverted_tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kReverted); }));
    EXPECT_TRUE(settle().error_reason == Reason::kTxReverted);

    const auto &valid_before{payload.payload.authorization.valid_before};
    now = std::chrono::seconds{valid_before.convert_to<int64_t>()};
    EXPECT_EQ(engine->prune(), 0);
    EXPECT_TRUE(guard->isCommitted(committed));
    EXPECT_TRUE(engine->isDiscarded(key(), payer.address));

    now += std::chrono::seconds{1};
    EXPECT_EQ(engine->prune(), 2);
    EXPECT_FALSE(guard->isTaken(committed));
    EXPECT_FALSE(engine->isDiscarded(key(), payer.address));
  }

  /**
   * @given timed out settlement
   * @when reconciling while unknown, then after confirmation
   * @then stays pending, then committed
   */
  TEST_F(SettlementEngineTest, ReconcileConfirmed) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillRepeatedly(testing::Invoke([this](auto &, CbT<TxStatus> cb) {
          now += std::chrono::seconds{61};
          cb(TxStatus::kPending);
        }));
    EXPECT_TRUE(settle().error_reason == Reason::kTxTimeout);

    EXPECT_EQ(reconcile(), 0);
    EXPECT_EQ(guard->pending().size(), 1);

    testing::Mock::VerifyAndClearExpectations(client.get());
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kConfirmed); }));
    EXPECT_EQ(reconcile(), 1);
    EXPECT_TRUE(guard->pending().empty());
    EXPECT_TRUE(guard->isCommitted(key()));
  }

  /**
   * @given timed out settlement that reverted later
   * @when reconciling
   * @then nonce released and payload discarded
   */
  TEST_F(SettlementEngineTest, ReconcileReverted) {
    expectSubmit(tx);
    EXPECT_CALL(*client, getTxStatus(tx, _))
        .WillOnce(testing::Invoke([this](auto &, CbT<TxStatus> cb) {
          now += std::chrono::seconds{61};
          cb(TxStatus::kPending);
        }))
        .WillOnce(testing::Invoke(
            [](auto &, CbT<TxStatus> cb) { cb(TxStatus::kReverted); }));
    EXPECT_TRUE(settle().error_reason == Reason::kTxTimeout);

    EXPECT_EQ(reconcile(), 1);
    EXPECT_FALSE(guard->isTaken(key()));
    EXPECT_TRUE(engine->isDiscarded(key(), payer.address));
  }

  /**
   * @given nothing pending
   * @when reconciling
   * @then completes with zero
   */
  TEST_F(SettlementEngineTest, ReconcileEmpty) {
    EXPECT_CALL(*client, getTxStatus(_, _)).Times(0);
    EXPECT_EQ(reconcile(), 0);
  }
}  // namespace x402::facilitator
