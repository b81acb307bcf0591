/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/uuid/random_generator.hpp>

#include "api/server.hpp"
#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "facilitator/facilitator.hpp"
#include "stream/stream_session.hpp"

namespace x402::stream {
  using boost::asio::io_context;
  using facilitator::Facilitator;

  /**
   * Runs one StreamSession on a strand: decodes buyer messages into events,
   * ticks deadlines and executes payment jobs through facilitator.
   */
  class StreamActor : public api::WsConnection,
                      public std::enable_shared_from_this<StreamActor> {
   public:
    using OnEnded = std::function<void(const std::string &stream_id)>;

    StreamActor(io_context &io,
                std::shared_ptr<Facilitator> facilitator,
                std::shared_ptr<clock::UTCClock> clock,
                StreamTerms terms,
                std::string stream_id,
                api::WsSend send,
                std::chrono::milliseconds tick_interval,
                OnEnded on_ended);

    /** Starts deadline ticks */
    void start();

    void onMessage(std::string_view text) override;

    void onClose() override;

    /** Queues event for the session */
    void post(Event event);

    const std::string &streamId() const {
      return stream_id_;
    }

   private:
    void process(Event event);

    void run(PaymentJob job);

    void scheduleTick();

    void send(Outbound outbound);

    boost::asio::strand<io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<Facilitator> facilitator_;
    std::shared_ptr<clock::UTCClock> clock_;
    std::string stream_id_;
    StreamSession session_;
    api::WsSend send_;
    std::chrono::milliseconds tick_interval_;
    OnEnded on_ended_;
    boost::uuids::random_generator uuid_;
    common::Logger log_;
  };
}  // namespace x402::stream
