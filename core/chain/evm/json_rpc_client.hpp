/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>

#include "codec/json/json.hpp"
#include "common/async.hpp"
#include "common/logger.hpp"

namespace x402::chain::evm {
  using boost::asio::io_context;
  using codec::json::Document;

  /**
   * Endpoint parsed from "http://host[:port][/path]" or "https://..."
   */
  struct RpcUrl {
    bool tls{};
    std::string host;
    std::string port;
    std::string target;

    static outcome::result<RpcUrl> parse(std::string_view url);
  };

  /**
   * Ethereum JSON-RPC over HTTP POST, one connection per call
   */
  class JsonRpcClient {
   public:
    JsonRpcClient(io_context &io, RpcUrl url, std::chrono::seconds timeout);
    virtual ~JsonRpcClient() = default;

    /**
     * Calls `method` with positional `params`
     * @param cb - copy of the "result" member, ChainError::kRpcUnavailable if
     * request was not sent, ChainError::kNoResponse if it was sent and reply
     * was lost, ChainError::kRpcError on JSON-RPC error
     */
    virtual void call(std::string_view method,
                      Document params,
                      CbT<Document> cb);

   private:
    io_context &io_;
    RpcUrl url_;
    std::chrono::seconds timeout_;
    std::shared_ptr<boost::asio::ssl::context> ssl_;
    std::atomic<uint64_t> next_id_{1};
    common::Logger log_;
  };
}  // namespace x402::chain::evm
