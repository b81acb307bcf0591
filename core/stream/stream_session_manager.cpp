/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/stream_session_manager.hpp"

#include <boost/uuid/uuid_io.hpp>

#include "common/ptr.hpp"

namespace x402::stream {
  StreamSessionManager::StreamSessionManager(
      io_context &io,
      std::shared_ptr<Facilitator> facilitator,
      std::shared_ptr<clock::UTCClock> clock,
      StreamTerms terms,
      std::chrono::milliseconds tick_interval)
      : io_{io},
        facilitator_{std::move(facilitator)},
        clock_{std::move(clock)},
        terms_{std::move(terms)},
        tick_interval_{tick_interval},
        log_{common::createLogger("streams")} {}

  std::shared_ptr<StreamActor> StreamSessionManager::open(api::WsSend send) {
    std::shared_ptr<StreamActor> actor;
    {
      std::lock_guard lock{mutex_};
      auto stream_id{boost::uuids::to_string(uuid_())};
      actor = std::make_shared<StreamActor>(
          io_,
          facilitator_,
          clock_,
          terms_,
          stream_id,
          std::move(send),
          tick_interval_,
          weakCb(*this, [](auto &&self, const std::string &stream_id) {
            self->remove(stream_id);
          }));
      actors_.emplace(stream_id, actor);
      log_->info("stream {} opened, {} active", stream_id, actors_.size());
    }
    actor->start();
    return actor;
  }

  api::WsFactory StreamSessionManager::factory() {
    return [weak{weak_from_this()}](
               api::WsSend send) -> std::shared_ptr<api::WsConnection> {
      if (auto self{weak.lock()}) {
        return self->open(std::move(send));
      }
      return nullptr;
    };
  }

  std::shared_ptr<StreamActor> StreamSessionManager::find(
      const std::string &stream_id) const {
    std::lock_guard lock{mutex_};
    auto it{actors_.find(stream_id)};
    return it == actors_.end() ? nullptr : it->second;
  }

  size_t StreamSessionManager::size() const {
    std::lock_guard lock{mutex_};
    return actors_.size();
  }

  void StreamSessionManager::remove(const std::string &stream_id) {
    std::lock_guard lock{mutex_};
    actors_.erase(stream_id);
  }
}  // namespace x402::stream
