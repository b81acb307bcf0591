/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "stream/stream_actor.hpp"

namespace x402::stream {

  /**
   * Creates stream per websocket connection and keeps it until the stream
   * ends
   */
  class StreamSessionManager
      : public std::enable_shared_from_this<StreamSessionManager> {
   public:
    StreamSessionManager(io_context &io,
                         std::shared_ptr<Facilitator> facilitator,
                         std::shared_ptr<clock::UTCClock> clock,
                         StreamTerms terms,
                         std::chrono::milliseconds tick_interval);

    /** Starts new stream writing to `send` */
    std::shared_ptr<StreamActor> open(api::WsSend send);

    api::WsFactory factory();

    std::shared_ptr<StreamActor> find(const std::string &stream_id) const;

    size_t size() const;

   private:
    void remove(const std::string &stream_id);

    io_context &io_;
    std::shared_ptr<Facilitator> facilitator_;
    std::shared_ptr<clock::UTCClock> clock_;
    StreamTerms terms_;
    std::chrono::milliseconds tick_interval_;
    mutable std::mutex mutex_;
    boost::uuids::random_generator uuid_;
    std::map<std::string, std::shared_ptr<StreamActor>> actors_;
    common::Logger log_;
  };
}  // namespace x402::stream
