/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/stream_actor.hpp"

#include <boost/asio/post.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "api/gateway.hpp"

namespace x402::stream {
  using api::makeError;
  using api::Request;
  using api::Response;
  using codec::json::decode;
  using codec::json::format;
  using codec::json::parse;

  StreamActor::StreamActor(io_context &io,
                           std::shared_ptr<Facilitator> facilitator,
                           std::shared_ptr<clock::UTCClock> clock,
                           StreamTerms terms,
                           std::string stream_id,
                           api::WsSend send,
                           std::chrono::milliseconds tick_interval,
                           OnEnded on_ended)
      : strand_{boost::asio::make_strand(io)},
        timer_{strand_},
        facilitator_{std::move(facilitator)},
        clock_{std::move(clock)},
        stream_id_{stream_id},
        session_{std::move(terms), std::move(stream_id)},
        send_{std::move(send)},
        tick_interval_{tick_interval},
        on_ended_{std::move(on_ended)},
        log_{common::createLogger("stream")} {}

  void StreamActor::start() {
    boost::asio::post(strand_, [self{shared_from_this()}] {
      self->scheduleTick();
    });
  }

  void StreamActor::onMessage(std::string_view text) {
    auto doc{parse(text)};
    if (!doc) {
      return send_(api::formatResponse(
          makeError(api::Value{}, api::kParseError, "Parse error")));
    }
    auto request{decode<Request>(doc.value())};
    if (!request) {
      return send_(api::formatResponse(
          makeError(api::Value{}, api::kInvalidRequest, "Invalid Request")));
    }
    auto &req{request.value()};
    auto invalid_params{[&](const std::error_code &ec) {
      send_(api::formatResponse(makeError(
          req.id, api::kInvalidParams, "Invalid params: " + ec.message())));
    }};
    if (req.method == kMethodInit) {
      auto params{decode<InitParams>(req.params)};
      if (!params) {
        return invalid_params(params.error());
      }
      return post(event::Init{std::move(req.id), std::move(params.value())});
    }
    if (req.method == kMethodPay) {
      auto params{decode<PayParams>(req.params)};
      if (!params) {
        return invalid_params(params.error());
      }
      return post(event::Pay{std::move(req.id), std::move(params.value())});
    }
    if (req.method == kMethodEnd) {
      return post(event::End{std::move(req.id)});
    }
    if (req.method == kMethodKeepalive) {
      return post(event::Keepalive{std::move(req.id)});
    }
    send_(api::formatResponse(
        makeError(req.id, api::kMethodNotFound, "Method not found")));
  }

  void StreamActor::onClose() {
    post(event::End{});
  }

  void StreamActor::post(Event event) {
    boost::asio::post(
        strand_,
        [self{shared_from_this()}, event{std::move(event)}]() mutable {
          self->process(std::move(event));
        });
  }

  void StreamActor::process(Event event) {
    if (session_.state() == StreamState::kEnded) {
      return;
    }
    auto transition{session_.handle(std::move(event), clock_->nowMs())};
    for (auto &outbound : transition.out) {
      send(std::move(outbound));
    }
    if (transition.job) {
      run(std::move(*transition.job));
    }
    if (session_.state() == StreamState::kEnded) {
      log_->info("stream {} ended at slice {}",
                 stream_id_,
                 session_.sliceIndex());
      timer_.cancel();
      if (on_ended_) {
        on_ended_(stream_id_);
      }
    }
  }

  void StreamActor::run(PaymentJob job) {
    auto request{std::make_shared<payment::VerifyRequest>(
        std::move(job.request))};
    const auto slice{job.slice_index};
    const auto settle{job.settle};
    log_->debug("stream {} slice {} payment", stream_id_, slice);
    auto self{shared_from_this()};
    facilitator_->verify(*request, [self, request, slice, settle](
                                       auto &&_verify) {
      if (!_verify) {
        return self->post(event::PaymentDone{slice, _verify.error()});
      }
      auto verify{std::move(_verify.value())};
      if (!verify.is_valid || !settle) {
        return self->post(
            event::PaymentDone{slice, PaymentResult{std::move(verify), {}}});
      }
      self->facilitator_->settle(
          *request, [self, slice, verify](auto &&_settle) {
            if (!_settle) {
              return self->post(event::PaymentDone{slice, _settle.error()});
            }
            self->post(event::PaymentDone{
                slice, PaymentResult{verify, std::move(_settle.value())}});
          });
    });
  }

  void StreamActor::scheduleTick() {
    timer_.expires_after(tick_interval_);
    timer_.async_wait([self{shared_from_this()}](auto ec) {
      if (ec || self->session_.state() == StreamState::kEnded) {
        return;
      }
      self->process(event::Tick{});
      self->scheduleTick();
    });
  }

  void StreamActor::send(Outbound outbound) {
    outcome::result<std::string> text{std::string{}};
    if (outbound.reply_id.IsNull()) {
      text = format(encode(Request{
          encode(boost::uuids::to_string(uuid_())),
          std::move(outbound.message.method),
          std::move(outbound.message.params),
      }));
    } else {
      api::Document result{rapidjson::kObjectType};
      auto &allocator{result.GetAllocator()};
      Set(result, "method", outbound.message.method, allocator);
      Set(result,
          "params",
          api::Value{outbound.message.params, allocator},
          allocator);
      text = format(encode(
          Response{std::move(outbound.reply_id), std::move(result)}));
    }
    if (!text) {
      log_->error("stream {} format: {}", stream_id_, text.error().message());
      return;
    }
    send_(std::move(text.value()));
  }
}  // namespace x402::stream
