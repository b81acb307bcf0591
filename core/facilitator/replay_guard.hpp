/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <tuple>

#include "clock/time.hpp"
#include "payment/types.hpp"

namespace x402::facilitator {
  using payment::Address;
  using payment::Network;
  using payment::Nonce;
  using payment::TxHash;

  /**
   * Scope of at-most-once acceptance
   */
  struct NonceKey {
    Network network{};
    Address asset;
    Nonce nonce;

    bool operator<(const NonceKey &other) const {
      return std::tie(network, asset, nonce)
             < std::tie(other.network, other.asset, other.nonce);
    }
    bool operator==(const NonceKey &other) const {
      return std::tie(network, asset, nonce)
             == std::tie(other.network, other.asset, other.nonce);
    }
  };

  /**
   * Reservation with unknown on-chain outcome
   */
  struct PendingSettlement {
    NonceKey key;
    TxHash tx;
  };

  /**
   * At-most-once acceptance of (network, asset, nonce).
   * Free -> reserved by `reserve`, reserved -> committed by `commit`,
   * reserved -> free by `release`. Committed is permanent while the
   * authorization is valid; `prune` forgets it after `expires`.
   */
  class ReplayGuard {
   public:
    /**
     * @param expires - `validBefore` of the authorization
     * @return true for the single caller that moved key from free
     */
    bool reserve(const NonceKey &key,
                 clock::UnixTime expires = clock::UnixTime::max());

    /** Idempotent, also valid for a key never reserved */
    void commit(const NonceKey &key);

    /** Frees reserved key, no effect on committed key */
    void release(const NonceKey &key);

    bool isCommitted(const NonceKey &key) const;

    /** Reserved or committed */
    bool isTaken(const NonceKey &key) const;

    /** Keeps reservation until reconciled with outcome of `tx` */
    void markPending(const NonceKey &key, const TxHash &tx);

    std::vector<PendingSettlement> pending() const;

    /**
     * Forgets committed and pending keys expired before `now`.
     * Expired authorizations are refused before the nonce is looked up.
     * @return number of keys removed
     */
    size_t prune(clock::UnixTime now);

   private:
    enum class State { kReserved, kPending, kCommitted };
    struct Slot {
      State state;
      TxHash tx;
      clock::UnixTime expires{clock::UnixTime::max()};
    };

    mutable std::mutex mutex_;
    std::map<NonceKey, Slot> slots_;
  };
}  // namespace x402::facilitator
