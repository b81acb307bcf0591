/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/evm/json_rpc_client.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "chain/chain_client.hpp"
#include "codec/json/coding.hpp"

#define MOVE(x)  \
  x {            \
    std::move(x) \
  }

#define EC_CB()                              \
  if (ec) {                                  \
    return cb(ChainError::kRpcUnavailable);  \
  }

namespace x402::chain::evm {
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace net = boost::asio;
  namespace ssl = net::ssl;
  using tcp = net::ip::tcp;
  using codec::json::Value;

  using StringCb = std::function<void(outcome::result<std::string>)>;

  template <bool kTls>
  struct ClientSession {
    using Stream = std::conditional_t<kTls,
                                      beast::ssl_stream<beast::tcp_stream>,
                                      beast::tcp_stream>;

    template <typename... Args>
    explicit ClientSession(io_context &io, Args &&...args)
        : resolver{io},
          stream{net::make_strand(io), std::forward<Args>(args)...} {}
    ClientSession(const ClientSession &) = delete;
    ClientSession(ClientSession &&) = delete;
    ~ClientSession() {
      boost::system::error_code ec;
      beast::get_lowest_layer(stream).socket().shutdown(
          tcp::socket::shutdown_both, ec);
    }
    ClientSession &operator=(const ClientSession &) = delete;
    ClientSession &operator=(ClientSession &&) = delete;

    static void post(std::shared_ptr<ClientSession> s,
                     const RpcUrl &url,
                     std::chrono::seconds timeout,
                     std::string body,
                     StringCb cb) {
      s->req.method(http::verb::post);
      s->req.target(url.target);
      s->req.set(http::field::host, url.host);
      s->req.set(http::field::content_type, "application/json");
      s->req.body() = std::move(body);
      s->req.prepare_payload();
      if constexpr (kTls) {
        if (!SSL_set_tlsext_host_name(s->stream.native_handle(),
                                      url.host.c_str())) {
          return cb(ChainError::kRpcUnavailable);
        }
      }
      beast::get_lowest_layer(s->stream).expires_after(timeout);
      s->resolver.async_resolve(
          url.host, url.port, [s, MOVE(cb)](auto &&ec, auto &&iterator) {
            EC_CB();
            beast::get_lowest_layer(s->stream).async_connect(
                iterator, [s, MOVE(cb)](auto &&ec, auto &&) {
                  EC_CB();
                  if constexpr (kTls) {
                    s->stream.async_handshake(
                        ssl::stream_base::client, [s, MOVE(cb)](auto &&ec) {
                          EC_CB();
                          write(s, std::move(cb));
                        });
                  } else {
                    write(s, std::move(cb));
                  }
                });
          });
    }

    static void write(std::shared_ptr<ClientSession> s, StringCb cb) {
      http::async_write(
          s->stream, s->req, [s, MOVE(cb)](auto &&ec, auto &&) {
            EC_CB();
            http::async_read(
                s->stream, s->buffer, s->res, [s, MOVE(cb)](auto &&ec, auto &&) {
                  if (ec) {
                    return cb(ChainError::kNoResponse);
                  }
                  if (s->res.result() != http::status::ok) {
                    return cb(ChainError::kRpcUnavailable);
                  }
                  cb(std::move(s->res.body()));
                });
          });
    }

    tcp::resolver resolver;
    Stream stream;
    http::request<http::string_body> req;
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
  };

  outcome::result<RpcUrl> RpcUrl::parse(std::string_view url) {
    RpcUrl out;
    constexpr std::string_view kHttp{"http://"};
    constexpr std::string_view kHttps{"https://"};
    if (url.substr(0, kHttps.size()) == kHttps) {
      out.tls = true;
      url.remove_prefix(kHttps.size());
    } else if (url.substr(0, kHttp.size()) == kHttp) {
      url.remove_prefix(kHttp.size());
    } else {
      return ChainError::kInvalidUrl;
    }
    auto slash{url.find('/')};
    auto authority{url.substr(0, slash)};
    out.target =
        slash == std::string_view::npos ? "/" : std::string{url.substr(slash)};
    auto colon{authority.rfind(':')};
    if (colon == std::string_view::npos) {
      out.host = std::string{authority};
      out.port = out.tls ? "443" : "80";
    } else {
      out.host = std::string{authority.substr(0, colon)};
      out.port = std::string{authority.substr(colon + 1)};
    }
    if (out.host.empty() || out.port.empty()) {
      return ChainError::kInvalidUrl;
    }
    return out;
  }

  JsonRpcClient::JsonRpcClient(io_context &io,
                               RpcUrl url,
                               std::chrono::seconds timeout)
      : io_{io},
        url_{std::move(url)},
        timeout_{timeout},
        log_{common::createLogger("rpc")} {
    if (url_.tls) {
      ssl_ = std::make_shared<ssl::context>(ssl::context::tls_client);
      ssl_->set_default_verify_paths();
      ssl_->set_verify_mode(ssl::verify_peer);
    }
  }

  void JsonRpcClient::call(std::string_view method,
                           Document params,
                           CbT<Document> cb) {
    using codec::json::Set;
    Document request{rapidjson::kObjectType};
    auto &allocator{request.GetAllocator()};
    Set(request, "jsonrpc", std::string_view{"2.0"}, allocator);
    Set(request, "id", next_id_++, allocator);
    Set(request, "method", method, allocator);
    Set(request, "params", Value{params, allocator}, allocator);
    OUTCOME_CB(auto body, codec::json::format(&request));

    auto on_body{[log{log_}, method{std::string{method}}, MOVE(cb)](
                     outcome::result<std::string> _body) {
      if (!_body) {
        log->debug("{}: {}", method, _body.error().message());
        return cb(_body.error());
      }
      auto _doc{codec::json::parse(_body.value())};
      if (!_doc) {
        return cb(ChainError::kBadResponse);
      }
      auto &doc{_doc.value()};
      if (!doc.IsObject()) {
        return cb(ChainError::kBadResponse);
      }
      auto error{doc.FindMember("error")};
      if (error != doc.MemberEnd() && !error->value.IsNull()) {
        auto message{codec::json::format(&error->value)};
        log->warn("{}: rpc error {}", method, message ? message.value() : "");
        return cb(ChainError::kRpcError);
      }
      auto it{doc.FindMember("result")};
      if (it == doc.MemberEnd()) {
        return cb(ChainError::kBadResponse);
      }
      Document result;
      result.CopyFrom(it->value, result.GetAllocator());
      cb(std::move(result));
    }};

    if (url_.tls) {
      auto s{std::make_shared<ClientSession<true>>(io_, *ssl_)};
      ClientSession<true>::post(
          s, url_, timeout_, std::move(body), std::move(on_body));
    } else {
      auto s{std::make_shared<ClientSession<false>>(io_)};
      ClientSession<false>::post(
          s, url_, timeout_, std::move(body), std::move(on_body));
    }
  }
}  // namespace x402::chain::evm
