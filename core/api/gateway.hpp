/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <set>

#include "api/envelope.hpp"
#include "api/server.hpp"
#include "facilitator/facilitator.hpp"

namespace x402::api {
  using facilitator::Facilitator;

  constexpr std::string_view kMethodSupported{"x402.supported"};
  constexpr std::string_view kMethodVerify{"x402.verify"};
  constexpr std::string_view kMethodSettle{"x402.settle"};

  /**
   * JSON-RPC style facilitator endpoint bound to one connection.
   * Requests are answered asynchronously, ids in flight must be unique.
   */
  class FacilitatorGateway
      : public WsConnection,
        public std::enable_shared_from_this<FacilitatorGateway> {
   public:
    FacilitatorGateway(std::shared_ptr<Facilitator> facilitator, WsSend send);

    void onMessage(std::string_view text) override;

    static WsFactory factory(std::shared_ptr<Facilitator> facilitator);

   private:
    void dispatch(Request request, const std::string &key);

    void reply(const std::string &key, const Response &response);

    std::shared_ptr<Facilitator> facilitator_;
    WsSend send_;
    std::mutex mutex_;
    std::set<std::string> in_flight_;
  };

  /** Serializes response, null id when request could not be read */
  std::string formatResponse(const Response &response);
}  // namespace x402::api
