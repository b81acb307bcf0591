/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "facilitator/settlement_engine.hpp"

#include <boost/asio/steady_timer.hpp>
#include <limits>

#include "primitives/address/address_codec.hpp"

namespace x402::facilitator {
  using chain::TxStatus;

  namespace {
    clock::UnixTime expiryOf(const payment::Authorization &auth) {
      using Rep = clock::UnixTime::rep;
      if (auth.valid_before
          >= payment::UInt256{std::numeric_limits<Rep>::max()}) {
        return clock::UnixTime::max();
      }
      return clock::UnixTime{auth.valid_before.convert_to<Rep>()};
    }
  }  // namespace

  SettlementEngine::SettlementEngine(io_context &io,
                                     std::shared_ptr<PaymentVerifier> verifier,
                                     std::shared_ptr<NetworkRegistry> registry,
                                     std::shared_ptr<ReplayGuard> replay_guard,
                                     std::shared_ptr<clock::UTCClock> clock,
                                     std::chrono::milliseconds poll_interval)
      : io_{io},
        verifier_{std::move(verifier)},
        registry_{std::move(registry)},
        replay_guard_{std::move(replay_guard)},
        clock_{std::move(clock)},
        poll_interval_{poll_interval},
        log_{common::createLogger("settle")} {}

  void SettlementEngine::settle(const PaymentRequirements &requirements,
                                const PaymentPayload &payload,
                                CbT<SettleResponse> cb) {
    const auto &auth{payload.payload.authorization};
    SettleResponse response;
    response.payer = auth.from;
    response.network = requirements.network;
    auto fail{[&](Reason reason) {
      response.error_reason = reason;
      cb(response);
    }};

    auto verdict{verifier_->check(requirements, payload, clock_->nowUTC())};
    if (!verdict.is_valid) {
      return fail(*verdict.invalid_reason);
    }
    auto key{nonceKey(requirements, payload)};
    if (isDiscarded(key, auth.from)) {
      return fail(Reason::kTxReverted);
    }

    auto expires{expiryOf(auth)};
    if (!replay_guard_->reserve(key, expires)) {
      log_->debug("nonce {} already reserved", key.nonce.toHex0x());
      return fail(Reason::kNonceReused);
    }

    auto submission{std::make_shared<Submission>()};
    submission->key = key;
    submission->payer = auth.from;
    submission->expires = expires;
    submission->response = response;
    submission->client = registry_->find(requirements.network)->client;
    submission->deadline =
        clock_->nowMs()
        + std::chrono::seconds{requirements.max_timeout_seconds};
    submission->cb = std::move(cb);

    log_->info("submitting transfer of {} from {} on {}",
               auth.value.str(),
               primitives::address::encodeToString(auth.from),
               requirements.network);
    submission->client->submitTransfer(
        requirements.asset,
        payload.payload,
        [self{shared_from_this()}, submission](outcome::result<TxHash> _tx) {
          if (!_tx) {
            self->log_->warn("submission failed: {}", _tx.error().message());
            self->replay_guard_->release(submission->key);
            submission->response.error_reason = Reason::kRpcUnavailable;
            return submission->cb(submission->response);
          }
          submission->response.transaction = _tx.value();
          self->poll(submission);
        });
  }

  void SettlementEngine::poll(std::shared_ptr<Submission> submission) {
    const auto &tx{*submission->response.transaction};
    submission->client->getTxStatus(
        tx,
        [self{shared_from_this()}, submission](
            outcome::result<TxStatus> _status) {
          auto &response{submission->response};
          const auto &tx{*response.transaction};
          if (_status && _status.value() == TxStatus::kConfirmed) {
            self->replay_guard_->commit(submission->key);
            self->log_->info("settled in {}", tx.toHex0x());
            response.success = true;
            return submission->cb(response);
          }
          if (_status && _status.value() == TxStatus::kReverted) {
            self->replay_guard_->release(submission->key);
            self->discard(
                submission->key, submission->payer, submission->expires);
            self->log_->warn("transaction {} reverted", tx.toHex0x());
            response.error_reason = Reason::kTxReverted;
            return submission->cb(response);
          }
          if (!_status) {
            self->log_->debug("receipt of {} unavailable: {}",
                              tx.toHex0x(),
                              _status.error().message());
          }
          if (self->clock_->nowMs() >= submission->deadline) {
            self->replay_guard_->markPending(submission->key, tx);
            {
              std::lock_guard lock{self->mutex_};
              self->pending_payers_.emplace(
                  tx, PendingPayer{submission->payer, submission->expires});
            }
            self->log_->warn("transaction {} not confirmed in time, pending "
                             "reconciliation",
                             tx.toHex0x());
            response.error_reason = Reason::kTxTimeout;
            return submission->cb(response);
          }
          self->wait(submission);
        });
  }

  void SettlementEngine::wait(std::shared_ptr<Submission> submission) {
    auto timer{std::make_shared<boost::asio::steady_timer>(io_)};
    timer->expires_after(poll_interval_);
    timer->async_wait([self{shared_from_this()}, timer, submission](
                          const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      self->poll(submission);
    });
  }

  void SettlementEngine::reconcile(std::function<void(size_t)> cb) {
    auto pending{replay_guard_->pending()};
    if (pending.empty()) {
      return cb(0);
    }
    struct Pass {
      std::mutex mutex;
      size_t remaining{};
      size_t resolved{};
      std::function<void(size_t)> cb;
    };
    auto pass{std::make_shared<Pass>()};
    pass->remaining = pending.size();
    pass->cb = std::move(cb);
    auto done{[pass](bool resolved) {
      std::unique_lock lock{pass->mutex};
      pass->resolved += resolved ? 1 : 0;
      if (--pass->remaining == 0) {
        lock.unlock();
        pass->cb(pass->resolved);
      }
    }};

    for (const auto &item : pending) {
      const auto *entry{registry_->find(item.key.network)};
      if (entry == nullptr) {
        done(false);
        continue;
      }
      entry->client->getTxStatus(
          item.tx,
          [self{shared_from_this()}, item, done](
              outcome::result<TxStatus> _status) {
            if (!_status || _status.value() == TxStatus::kPending) {
              self->log_->debug("transaction {} still unknown",
                                item.tx.toHex0x());
              return done(false);
            }
            boost::optional<PendingPayer> payer;
            {
              std::lock_guard lock{self->mutex_};
              auto it{self->pending_payers_.find(item.tx)};
              if (it != self->pending_payers_.end()) {
                payer = it->second;
                self->pending_payers_.erase(it);
              }
            }
            if (_status.value() == TxStatus::kConfirmed) {
              self->log_->info("reconciled {}: confirmed", item.tx.toHex0x());
              self->replay_guard_->commit(item.key);
            } else {
              self->log_->info("reconciled {}: reverted", item.tx.toHex0x());
              self->replay_guard_->release(item.key);
              if (payer) {
                self->discard(item.key, payer->payer, payer->expires);
              }
            }
            done(true);
          });
    }
  }

  bool SettlementEngine::isDiscarded(const NonceKey &key,
                                     const Address &payer) const {
    std::lock_guard lock{mutex_};
    return discarded_.count({key, payer}) != 0;
  }

  void SettlementEngine::discard(const NonceKey &key,
                                 const Address &payer,
                                 clock::UnixTime expires) {
    std::lock_guard lock{mutex_};
    discarded_.emplace(DiscardKey{key, payer}, expires);
  }

  size_t SettlementEngine::prune() {
    auto now{clock_->nowUTC()};
    auto removed{replay_guard_->prune(now)};
    std::lock_guard lock{mutex_};
    for (auto it{discarded_.begin()}; it != discarded_.end();) {
      if (it->second < now) {
        it = discarded_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    for (auto it{pending_payers_.begin()}; it != pending_payers_.end();) {
      if (it->second.expires < now) {
        it = pending_payers_.erase(it);
      } else {
        ++it;
      }
    }
    if (removed != 0) {
      log_->debug("pruned {} expired records", removed);
    }
    return removed;
  }
}  // namespace x402::facilitator
