/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/http_routes.hpp"

#include <fmt/format.h>

#include "api/gateway.hpp"
#include "common/logger.hpp"
#include "payment/payment_codec.hpp"

namespace x402::api {
  using codec::json::decode;
  using codec::json::encode;
  using codec::json::format;
  using codec::json::parse;
  using facilitator::Facilitator;

  namespace {
    std::string describe(std::string_view endpoint, std::string_view what) {
      return fmt::format(
          R"({{"endpoint":"{}","description":"POST to {} x402 payments","body":{{"paymentPayload":"PaymentPayload","paymentRequirements":"PaymentRequirements"}}}})",
          endpoint,
          what);
    }

    std::string errorBody(std::string_view message) {
      Document doc{rapidjson::kObjectType};
      codec::json::Set(doc, "error", message, doc.GetAllocator());
      return format(std::move(doc)).value();
    }

    template <typename T>
    std::string body(const T &value) {
      return format(encode(value)).value();
    }

    /// Shared handler shape of POST /verify and POST /settle
    template <typename Response>
    RouteHandler paymentRoute(
        std::shared_ptr<Facilitator> facilitator,
        std::string endpoint,
        void (Facilitator::*method)(const payment::VerifyRequest &,
                                    CbT<Response>),
        http::status failure_status) {
      return [=](const HttpRequest &request, const RouteCB &cb) {
        if (request.method() == http::verb::get) {
          return cb(makeJsonResponse(
              request,
              http::status::ok,
              describe(endpoint,
                       endpoint == "/verify" ? "verify" : "settle")));
        }
        if (request.method() != http::verb::post) {
          return cb(makeJsonResponse(request,
                                     http::status::method_not_allowed,
                                     errorBody("Method not allowed")));
        }
        auto params{[&]() -> outcome::result<payment::VerifyRequest> {
          OUTCOME_TRY(doc, parse(std::string_view{request.body()}));
          return decode<payment::VerifyRequest>(doc);
        }()};
        if (!params) {
          return cb(makeJsonResponse(
              request,
              http::status::bad_request,
              errorBody("Invalid request: " + params.error().message())));
        }
        auto version{request.version()};
        auto keep_alive{request.keep_alive()};
        ((*facilitator).*method)(
            params.value(),
            [cb, version, keep_alive, failure_status](auto &&_response) {
              HttpResponse response{http::status::ok, version};
              response.set(http::field::content_type, "application/json");
              response.keep_alive(keep_alive);
              if (!_response) {
                response.result(failure_status);
                response.body() = errorBody(_response.error().message());
              } else {
                response.body() = body(_response.value());
              }
              cb(std::move(response));
            });
      };
    }
  }  // namespace

  void setupFacilitatorRoutes(Routes &routes,
                              std::shared_ptr<Facilitator> facilitator) {
    routes["/supported"] = [facilitator](const HttpRequest &request,
                                         const RouteCB &cb) {
      cb(makeJsonResponse(
          request, http::status::ok, body(facilitator->supported())));
    };
    routes["/verify"] = paymentRoute<payment::VerifyResponse>(
        facilitator,
        "/verify",
        &Facilitator::verify,
        http::status::service_unavailable);
    routes["/settle"] = paymentRoute<payment::SettleResponse>(
        facilitator,
        "/settle",
        &Facilitator::settle,
        http::status::internal_server_error);
  }
}  // namespace x402::api
