/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace x402::api {
  namespace http = boost::beast::http;
  using tcp = boost::asio::ip::tcp;

  using HttpRequest = http::request<http::string_body>;
  using HttpResponse = http::response<http::string_body>;

  using RouteCB = std::function<void(HttpResponse)>;
  using RouteHandler = std::function<void(const HttpRequest &, RouteCB)>;
  /// Path -> handler, longest prefix is tried first
  using Routes = std::map<std::string, RouteHandler, std::greater<>>;

  /** Writes text frame to the socket, no effect once socket is closed */
  using WsSend = std::function<void(std::string)>;

  /**
   * Handler bound to one websocket connection
   */
  class WsConnection {
   public:
    virtual ~WsConnection() = default;

    /** Text frame received, called sequentially */
    virtual void onMessage(std::string_view text) = 0;

    /** Socket closed or failed */
    virtual void onClose() {}
  };

  using WsFactory = std::function<std::shared_ptr<WsConnection>(WsSend)>;
  /// Path -> connection factory for upgrade requests
  using WsRoutes = std::map<std::string, WsFactory, std::greater<>>;

  HttpResponse makeJsonResponse(const HttpRequest &request,
                                http::status status,
                                std::string body);

  /**
   * Creates and runs server accepting plain HTTP and websocket upgrades
   */
  void serve(std::shared_ptr<WsRoutes> ws_routes,
             std::shared_ptr<Routes> routes,
             boost::asio::io_context &ioc,
             std::string_view ip,
             unsigned short port);
}  // namespace x402::api
