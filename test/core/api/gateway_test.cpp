/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/gateway.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "chain/chain_client.hpp"
#include "codec/json/json.hpp"
#include "payment/payment_codec.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/facilitator/facilitator_mock.hpp"
#include "testutil/payment/test_payer.hpp"

namespace x402::api {
  using codec::json::format;
  using codec::json::parse;
  using facilitator::FacilitatorMock;
  using payment::Network;
  using payment::SettleResponse;
  using payment::VerifyRequest;
  using payment::VerifyResponse;
  using testing::_;

  class GatewayTest : public testing::Test {
   public:
    void SetUp() override {
      payment::TestPayer payer{1};
      VerifyRequest request;
      request.payment_requirements = payment::makeRequirements(
          Network::kBaseSepolia,
          10000,
          "0x209693Bc6afc0C5328bA36FaF03C514EF312287C"_address);
      request.payment_payload = payer.pay(
          request.payment_requirements, 1740672100, payment::makeNonce(1));
      params = format(encode(request)).value();
    }

    std::string call(std::string_view id, std::string_view method) const {
      return fmt::format(R"({{"id":{},"method":"{}","params":{}}})",
                         id,
                         method,
                         params);
    }

    /** Error code of last sent message */
    int64_t lastErrorCode() const {
      auto doc{parse(sent.back()).value()};
      return doc["error"]["code"].GetInt64();
    }

    std::shared_ptr<FacilitatorMock> facilitator{
        std::make_shared<FacilitatorMock>()};
    std::vector<std::string> sent;
    std::shared_ptr<FacilitatorGateway> gateway{
        std::make_shared<FacilitatorGateway>(
            facilitator, [this](std::string text) {
              sent.push_back(std::move(text));
            })};
    std::string params;
  };

  /**
   * @given supported request with numeric id
   * @when received
   * @then kinds returned with same id
   */
  TEST_F(GatewayTest, Supported) {
    EXPECT_CALL(*facilitator, supported())
        .WillOnce(testing::Return(payment::SupportedResponse{
            {{1, "exact", Network::kBaseSepolia}}}));
    gateway->onMessage(R"({"id":7,"method":"x402.supported"})");
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(
        sent[0],
        R"({"id":7,"result":{"kinds":[{"x402Version":1,"scheme":"exact","network":"base-sepolia"}]}})");
  }

  /**
   * @given text that is not JSON
   * @when received
   * @then parse error with null id
   */
  TEST_F(GatewayTest, ParseError) {
    gateway->onMessage("{");
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(sent[0],
              R"({"id":null,"error":{"code":-32700,"message":"Parse error"}})");
  }

  /**
   * @given JSON without method or with unusable id
   * @when received
   * @then invalid request, id echoed when readable
   */
  TEST_F(GatewayTest, InvalidRequest) {
    gateway->onMessage(R"({"id":"a"})");
    gateway->onMessage(R"({"id":{},"method":"x402.supported"})");
    gateway->onMessage("[]");
    ASSERT_EQ(sent.size(), 3);
    EXPECT_EQ(
        sent[0],
        R"({"id":"a","error":{"code":-32600,"message":"Invalid Request"}})");
    EXPECT_EQ(
        sent[1],
        R"({"id":null,"error":{"code":-32600,"message":"Invalid Request"}})");
    EXPECT_EQ(
        sent[2],
        R"({"id":null,"error":{"code":-32600,"message":"Invalid Request"}})");
  }

  /**
   * @given unknown method
   * @when received
   * @then method not found
   */
  TEST_F(GatewayTest, MethodNotFound) {
    gateway->onMessage(R"({"id":"x","method":"x402.refund"})");
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(lastErrorCode(), kMethodNotFound);
  }

  /**
   * @given verify without required params
   * @when received
   * @then invalid params, facilitator not called
   */
  TEST_F(GatewayTest, InvalidParams) {
    EXPECT_CALL(*facilitator, verify(_, _)).Times(0);
    gateway->onMessage(R"({"id":1,"method":"x402.verify","params":{}})");
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(lastErrorCode(), kInvalidParams);
    auto doc{parse(sent[0]).value()};
    EXPECT_EQ(std::string_view{doc["error"]["message"].GetString()}.substr(
                  0, 16),
              "Invalid params: ");
  }

  /**
   * @given verify request
   * @when facilitator answers
   * @then verdict returned as result
   */
  TEST_F(GatewayTest, Verify) {
    EXPECT_CALL(*facilitator, verify(_, _))
        .WillOnce(testing::Invoke([](const VerifyRequest &request,
                                     CbT<VerifyResponse> cb) {
          cb(VerifyResponse::valid(
              request.payment_payload.payload.authorization.from));
        }));
    gateway->onMessage(call(R"("v1")", kMethodVerify));
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(
        sent[0],
        R"({"id":"v1","result":{"isValid":true,"payer":"0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"}})");
  }

  /**
   * @given verify request and chain unreachable
   * @when facilitator fails
   * @then error 1002 with cause as data
   */
  TEST_F(GatewayTest, VerifyRpcUnavailable) {
    EXPECT_CALL(*facilitator, verify(_, _))
        .WillOnce(testing::Invoke([](auto &, CbT<VerifyResponse> cb) {
          cb(chain::ChainError::kRpcUnavailable);
        }));
    gateway->onMessage(call("1", kMethodVerify));
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(lastErrorCode(), kRpcUnavailable);
    auto doc{parse(sent[0]).value()};
    EXPECT_TRUE(doc["error"]["data"].IsString());
  }

  /**
   * @given settle request
   * @when facilitator reports business failure or error
   * @then failure as result, error as 1001
   */
  TEST_F(GatewayTest, Settle) {
    EXPECT_CALL(*facilitator, settle(_, _))
        .WillOnce(testing::Invoke([](auto &, CbT<SettleResponse> cb) {
          SettleResponse response;
          response.network = Network::kBaseSepolia;
          response.error_reason = payment::Reason::kTxReverted;
          cb(response);
        }))
        .WillOnce(testing::Invoke([](auto &, CbT<SettleResponse> cb) {
          cb(chain::ChainError::kBadResponse);
        }));
    gateway->onMessage(call("1", kMethodSettle));
    gateway->onMessage(call("2", kMethodSettle));
    ASSERT_EQ(sent.size(), 2);
    EXPECT_EQ(
        sent[0],
        R"({"id":1,"result":{"success":false,"network":"base-sepolia","errorReason":"tx_reverted"}})");
    EXPECT_EQ(lastErrorCode(), kSettlementFailed);
  }

  /**
   * @given request still in flight
   * @when another request with same id arrives
   * @then rejected, id usable again after first completes
   */
  TEST_F(GatewayTest, IdInFlight) {
    std::vector<CbT<SettleResponse>> pending;
    EXPECT_CALL(*facilitator, settle(_, _))
        .Times(2)
        .WillRepeatedly(testing::Invoke([&](auto &, CbT<SettleResponse> cb) {
          pending.push_back(std::move(cb));
        }));
    gateway->onMessage(call(R"("s")", kMethodSettle));
    gateway->onMessage(call(R"("s")", kMethodSettle));
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(lastErrorCode(), kIdCollision);

    ASSERT_EQ(pending.size(), 1);
    pending[0](SettleResponse{});
    ASSERT_EQ(sent.size(), 2);

    gateway->onMessage(call(R"("s")", kMethodSettle));
    EXPECT_EQ(pending.size(), 2);
    EXPECT_EQ(sent.size(), 2);
  }

  /**
   * @given two requests completing in reverse order
   * @when answered
   * @then each response carries its own id
   */
  TEST_F(GatewayTest, OutOfOrder) {
    std::vector<CbT<VerifyResponse>> pending;
    EXPECT_CALL(*facilitator, verify(_, _))
        .Times(2)
        .WillRepeatedly(testing::Invoke([&](auto &, CbT<VerifyResponse> cb) {
          pending.push_back(std::move(cb));
        }));
    gateway->onMessage(call("1", kMethodVerify));
    gateway->onMessage(call("2", kMethodVerify));
    ASSERT_EQ(pending.size(), 2);
    pending[1](VerifyResponse::invalid(boost::none, payment::Reason::kExpired));
    pending[0](VerifyResponse::invalid(boost::none,
                                       payment::Reason::kNonceReused));
    ASSERT_EQ(sent.size(), 2);
    EXPECT_EQ(
        sent[0],
        R"({"id":2,"result":{"isValid":false,"invalidReason":"expired"}})");
    EXPECT_EQ(
        sent[1],
        R"({"id":1,"result":{"isValid":false,"invalidReason":"nonce_reused"}})");
  }
}  // namespace x402::api
