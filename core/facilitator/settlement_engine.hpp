/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <map>

#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "facilitator/verifier.hpp"

namespace x402::facilitator {
  using boost::asio::io_context;
  using payment::SettleResponse;

  /**
   * Submits verified authorizations on chain exactly once per nonce.
   *
   * Outcome of a submission:
   * - confirmed: nonce committed, success with transaction hash
   * - reverted: nonce released, payload discarded, `tx_reverted`
   * - rpc failure before the transaction was sent: nonce released,
   *   `rpc_unavailable`
   * - sent but unacknowledged, or no receipt within `maxTimeoutSeconds`:
   *   nonce kept pending until `reconcile` learns the outcome of the
   *   expected transaction hash, `tx_timeout`
   *
   * Discarded authorizations are remembered by nonce and payer, as the
   * token contract tracks them, so a re-encoded signature of the same
   * authorization is refused as well.
   */
  class SettlementEngine
      : public std::enable_shared_from_this<SettlementEngine> {
   public:
    SettlementEngine(io_context &io,
                     std::shared_ptr<PaymentVerifier> verifier,
                     std::shared_ptr<NetworkRegistry> registry,
                     std::shared_ptr<ReplayGuard> replay_guard,
                     std::shared_ptr<clock::UTCClock> clock,
                     std::chrono::milliseconds poll_interval);

    void settle(const PaymentRequirements &requirements,
                const PaymentPayload &payload,
                CbT<SettleResponse> cb);

    /**
     * Queries every pending settlement once: confirmed are committed,
     * reverted are released, unknown stay pending
     * @param cb - number of settlements resolved
     */
    void reconcile(std::function<void(size_t)> cb);

    /** Whether authorization of `payer` with this nonce reverted before */
    bool isDiscarded(const NonceKey &key, const Address &payer) const;

    /**
     * Drops replay and discard records of authorizations already expired
     * @return number of records removed
     */
    size_t prune();

   private:
    using DiscardKey = std::pair<NonceKey, Address>;

    struct Submission {
      NonceKey key;
      Address payer;
      clock::UnixTime expires;
      SettleResponse response;
      std::shared_ptr<ChainClient> client;
      clock::UnixTimeMs deadline;
      CbT<SettleResponse> cb;
    };

    /// payer of a pending settlement, discarded if it reverts later
    struct PendingPayer {
      Address payer;
      clock::UnixTime expires;
    };

    void poll(std::shared_ptr<Submission> submission);
    void wait(std::shared_ptr<Submission> submission);
    void discard(const NonceKey &key,
                 const Address &payer,
                 clock::UnixTime expires);

    io_context &io_;
    std::shared_ptr<PaymentVerifier> verifier_;
    std::shared_ptr<NetworkRegistry> registry_;
    std::shared_ptr<ReplayGuard> replay_guard_;
    std::shared_ptr<clock::UTCClock> clock_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::map<DiscardKey, clock::UnixTime> discarded_;
    std::map<TxHash, PendingPayer> pending_payers_;

    common::Logger log_;
  };
}  // namespace x402::facilitator
