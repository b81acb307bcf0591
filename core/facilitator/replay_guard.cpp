/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "facilitator/replay_guard.hpp"

namespace x402::facilitator {
  bool ReplayGuard::reserve(const NonceKey &key, clock::UnixTime expires) {
    std::lock_guard lock{mutex_};
    return slots_.emplace(key, Slot{State::kReserved, {}, expires}).second;
  }

  void ReplayGuard::commit(const NonceKey &key) {
    std::lock_guard lock{mutex_};
    slots_[key].state = State::kCommitted;
  }

  void ReplayGuard::release(const NonceKey &key) {
    std::lock_guard lock{mutex_};
    auto it{slots_.find(key)};
    if (it != slots_.end() && it->second.state != State::kCommitted) {
      slots_.erase(it);
    }
  }

  bool ReplayGuard::isCommitted(const NonceKey &key) const {
    std::lock_guard lock{mutex_};
    auto it{slots_.find(key)};
    return it != slots_.end() && it->second.state == State::kCommitted;
  }

  bool ReplayGuard::isTaken(const NonceKey &key) const {
    std::lock_guard lock{mutex_};
    return slots_.count(key) != 0;
  }

  void ReplayGuard::markPending(const NonceKey &key, const TxHash &tx) {
    std::lock_guard lock{mutex_};
    auto it{slots_.find(key)};
    if (it != slots_.end() && it->second.state == State::kReserved) {
      it->second.state = State::kPending;
      it->second.tx = tx;
    }
  }

  std::vector<PendingSettlement> ReplayGuard::pending() const {
    std::lock_guard lock{mutex_};
    std::vector<PendingSettlement> result;
    for (const auto &[key, slot] : slots_) {
      if (slot.state == State::kPending) {
        result.push_back({key, slot.tx});
      }
    }
    return result;
  }

  size_t ReplayGuard::prune(clock::UnixTime now) {
    std::lock_guard lock{mutex_};
    size_t removed{};
    for (auto it{slots_.begin()}; it != slots_.end();) {
      if (it->second.state != State::kReserved && it->second.expires < now) {
        it = slots_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }
}  // namespace x402::facilitator
