/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/server.hpp"

#include <queue>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "common/logger.hpp"

namespace x402::api {
  namespace beast = boost::beast;
  namespace websocket = beast::websocket;
  namespace net = boost::asio;

  const common::Logger logger = common::createLogger("server");

  template <typename Map>
  auto findRoute(const Map &map, std::string_view target) {
    auto path{target.substr(0, target.find('?'))};
    for (auto it{map.begin()}; it != map.end(); ++it) {
      if (path.substr(0, it->first.size()) == it->first) {
        return it;
      }
    }
    return map.end();
  }

  struct SocketSession : std::enable_shared_from_this<SocketSession> {
    explicit SocketSession(tcp::socket &&socket) : socket{std::move(socket)} {}

    template <class Body, class Allocator>
    void doAccept(http::request<Body, http::basic_fields<Allocator>> req,
                  const WsFactory &factory) {
      std::weak_ptr<SocketSession> weak{shared_from_this()};
      connection = factory([weak](std::string text) {
        if (auto self{weak.lock()}) {
          self->write(std::move(text));
        }
      });
      if (!connection) {
        return;
      }
      socket.async_accept(req, [self{shared_from_this()}](auto ec) {
        if (ec) {
          return self->close();
        }
        self->doRead();
      });
    }

    void doRead() {
      socket.async_read(buffer, [self{shared_from_this()}](auto ec, auto) {
        if (ec) {
          return self->close();
        }
        self->onRead();
        self->doRead();
      });
    }

    void onRead() {
      std::string_view text{static_cast<const char *>(buffer.cdata().data()),
                            buffer.cdata().size()};
      if (connection) {
        connection->onMessage(text);
      }
      buffer.clear();
    }

    void write(std::string text) {
      net::post(socket.get_executor(),
                [self{shared_from_this()}, text{std::move(text)}]() mutable {
                  self->pending_writes.push(std::move(text));
                  self->flush();
                });
    }

    void flush() {
      if (!writing && !pending_writes.empty()) {
        auto &text{pending_writes.front()};
        writing = true;
        socket.text(true);
        socket.async_write(net::buffer(text.data(), text.size()),
                           [self{shared_from_this()}](auto e, auto) {
                             self->writing = false;
                             if (e) {
                               self->pending_writes = {};
                               return;
                             }
                             self->pending_writes.pop();
                             self->flush();
                           });
      }
    }

    void close() {
      if (connection) {
        connection->onClose();
        connection.reset();
      }
    }

    std::queue<std::string> pending_writes;
    bool writing{false};
    websocket::stream<tcp::socket> socket;
    beast::flat_buffer buffer;
    std::shared_ptr<WsConnection> connection;
  };

  struct HttpSession : public std::enable_shared_from_this<HttpSession> {
    HttpSession(tcp::socket &&socket,
                std::shared_ptr<WsRoutes> ws_routes,
                std::shared_ptr<Routes> routes)
        : stream(std::move(socket)),
          ws_routes{std::move(ws_routes)},
          routes(std::move(routes)) {}

    void run() {
      net::dispatch(stream.get_executor(),
                    [self{shared_from_this()}]() { self->doRead(); });
    }

    void doRead() {
      request = {};

      http::async_read(stream,
                       buffer,
                       request,
                       [self{shared_from_this()}](beast::error_code ec,
                                                  std::size_t) {
                         self->onRead(ec);
                       });
    }

    void onRead(boost::system::error_code ec) {
      if (ec == http::error::end_of_stream) {
        return doClose();
      }

      if (ec) {
        logger->debug("http read: {}", ec.message());
        return;
      }

      if (websocket::is_upgrade(request)) {
        auto it{findRoute(*ws_routes, request.target())};
        if (it != ws_routes->end()) {
          std::make_shared<SocketSession>(stream.release_socket())
              ->doAccept(std::move(request), it->second);
          return;
        }
        logger->warn("no websocket route for '{}'",
                     std::string_view{request.target()});
        return doClose();
      }

      handleRequest();
    }

    void handleRequest() {
      auto it{findRoute(*routes, request.target())};
      if (it == routes->end()) {
        return doWrite(makeJsonResponse(
            request, http::status::not_found, R"({"error":"Not found"})"));
      }
      it->second(request, [self{shared_from_this()}](HttpResponse response) {
        net::post(self->stream.get_executor(),
                  [self, response{std::move(response)}]() mutable {
                    self->doWrite(std::move(response));
                  });
      });
    }

    void doWrite(HttpResponse response) {
      this->response = std::move(response);
      this->response.prepare_payload();
      http::async_write(
          stream,
          this->response,
          [self{shared_from_this()}](beast::error_code ec, std::size_t) {
            if (ec || !self->response.keep_alive()) {
              return self->doClose();
            }
            self->doRead();
          });
    }

    void doClose() {
      boost::system::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    HttpRequest request;
    HttpResponse response;
    std::shared_ptr<WsRoutes> ws_routes;
    std::shared_ptr<Routes> routes;
  };

  struct Server : std::enable_shared_from_this<Server> {
    Server(tcp::acceptor &&acceptor,
           std::shared_ptr<WsRoutes> ws_routes,
           std::shared_ptr<Routes> routes)
        : acceptor{std::move(acceptor)},
          ws_routes{std::move(ws_routes)},
          routes{std::move(routes)} {}

    void run() {
      doAccept();
    }

    void doAccept() {
      acceptor.async_accept([self{shared_from_this()}](auto ec, auto socket) {
        if (!ec) {
          std::make_shared<HttpSession>(
              std::move(socket), self->ws_routes, self->routes)
              ->run();
        }
        self->doAccept();
      });
    }

    tcp::acceptor acceptor;
    std::shared_ptr<WsRoutes> ws_routes;
    std::shared_ptr<Routes> routes;
  };

  HttpResponse makeJsonResponse(const HttpRequest &request,
                                http::status status,
                                std::string body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    return response;
  }

  void serve(std::shared_ptr<WsRoutes> ws_routes,
             std::shared_ptr<Routes> routes,
             boost::asio::io_context &ioc,
             std::string_view ip,
             unsigned short port) {
    std::make_shared<Server>(
        tcp::acceptor{ioc, {net::ip::make_address(ip), port}},
        std::move(ws_routes),
        std::move(routes))
        ->run();
  }
}  // namespace x402::api
