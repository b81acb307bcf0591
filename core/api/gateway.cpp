/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/gateway.hpp"

#include "chain/chain_client.hpp"
#include "common/logger.hpp"
#include "payment/payment_codec.hpp"

namespace x402::api {
  using codec::json::decode;
  using codec::json::format;
  using codec::json::parse;

  namespace {
    const common::Logger &log() {
      static common::Logger logger = common::createLogger("gateway");
      return logger;
    }

    Response makeResult(const Value &id, Document result) {
      return {clone(id), std::move(result)};
    }

    Response invalidParams(const Value &id, const std::error_code &ec) {
      return makeError(id, kInvalidParams, "Invalid params: " + ec.message());
    }
  }  // namespace

  std::string formatResponse(const Response &response) {
    // response contains only encodable values
    return format(encode(response)).value();
  }

  FacilitatorGateway::FacilitatorGateway(
      std::shared_ptr<Facilitator> facilitator, WsSend send)
      : facilitator_{std::move(facilitator)}, send_{std::move(send)} {}

  WsFactory FacilitatorGateway::factory(
      std::shared_ptr<Facilitator> facilitator) {
    return [facilitator{std::move(facilitator)}](WsSend send) {
      return std::make_shared<FacilitatorGateway>(facilitator,
                                                  std::move(send));
    };
  }

  void FacilitatorGateway::onMessage(std::string_view text) {
    auto doc{parse(text)};
    if (!doc) {
      return send_(
          formatResponse(makeError(Value{}, kParseError, "Parse error")));
    }
    auto request{decode<Request>(doc.value())};
    if (!request) {
      Value null_id;
      const Value *id{&null_id};
      if (doc.value().IsObject()) {
        auto it{doc.value().FindMember("id")};
        if (it != doc.value().MemberEnd()
            && (it->value.IsString() || it->value.IsNumber())) {
          id = &it->value;
        }
      }
      return send_(
          formatResponse(makeError(*id, kInvalidRequest, "Invalid Request")));
    }
    auto key{format(&request.value().id)};
    if (!key) {
      return send_(formatResponse(
          makeError(Value{}, kInvalidRequest, "Invalid Request")));
    }
    {
      std::lock_guard lock{mutex_};
      if (!in_flight_.insert(key.value()).second) {
        return send_(formatResponse(makeError(
            request.value().id, kIdCollision, "Request id already in flight")));
      }
    }
    dispatch(std::move(request.value()), key.value());
  }

  void FacilitatorGateway::dispatch(Request request, const std::string &key) {
    const auto &id{request.id};
    if (request.method == kMethodSupported) {
      return reply(key, makeResult(id, encode(facilitator_->supported())));
    }
    if (request.method != kMethodVerify && request.method != kMethodSettle) {
      return reply(key, makeError(id, kMethodNotFound, "Method not found"));
    }
    auto params{decode<payment::VerifyRequest>(request.params)};
    if (!params) {
      return reply(key, invalidParams(id, params.error()));
    }
    auto id_copy{std::make_shared<Document>(clone(id))};
    auto self{shared_from_this()};
    if (request.method == kMethodVerify) {
      facilitator_->verify(
          params.value(), [self, key, id_copy](auto &&_response) {
            if (!_response) {
              log()->warn("verify failed: {}", _response.error().message());
              auto error{
                  makeError(*id_copy, kRpcUnavailable, "RPC unavailable")};
              boost::get<Response::Error>(error.result).data =
                  encode(_response.error().message());
              return self->reply(key, error);
            }
            self->reply(key, makeResult(*id_copy, encode(_response.value())));
          });
      return;
    }
    facilitator_->settle(
        params.value(), [self, key, id_copy](auto &&_response) {
          if (!_response) {
            log()->warn("settle failed: {}", _response.error().message());
            auto error{
                makeError(*id_copy, kSettlementFailed, "Settlement failed")};
            boost::get<Response::Error>(error.result).data =
                encode(_response.error().message());
            return self->reply(key, error);
          }
          self->reply(key, makeResult(*id_copy, encode(_response.value())));
        });
  }

  void FacilitatorGateway::reply(const std::string &key,
                                 const Response &response) {
    {
      std::lock_guard lock{mutex_};
      in_flight_.erase(key);
    }
    send_(formatResponse(response));
  }
}  // namespace x402::api
