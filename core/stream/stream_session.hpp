/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>

#include "stream/types.hpp"

namespace x402::stream {
  using payment::Nonce;

  /**
   * Protocol state of one payment stream.
   * Consumes one event at a time and returns messages to send and payment to
   * run, performs no io.
   */
  class StreamSession {
   public:
    StreamSession(StreamTerms terms, std::string stream_id);

    Transition handle(Event event, UnixTimeMs now);

    const std::string &streamId() const {
      return stream_id_;
    }
    StreamState state() const {
      return state_;
    }
    uint64_t sliceIndex() const {
      return slice_index_;
    }
    UnixTimeMs prepaidUntil() const {
      return prepaid_until_;
    }
    UnixTimeMs nextRequireAt() const {
      return next_require_at_;
    }
    /// payment job was issued and result not yet handled
    bool settling() const {
      return settling_;
    }

   private:
    void onInit(event::Init &e, UnixTimeMs now, Transition &t);
    void onPay(event::Pay &e, Transition &t);
    void onPaymentDone(event::PaymentDone &e, UnixTimeMs now, Transition &t);
    void onEnd(event::End &e, Transition &t);
    void onKeepalive(event::Keepalive &e, UnixTimeMs now, Transition &t);
    void onTick(UnixTimeMs now, Transition &t);

    /// Issues requirement for current slice index
    UnixTimeMs pauseAt() const;
    void require(UnixTimeMs now, Transition &t);

    void reject(Document reply_id,
                uint64_t slice_index,
                boost::optional<Reason> reason,
                std::string_view error,
                Transition &t) const;

    Document keepaliveParams(UnixTimeMs now) const;

    PaymentRequirements makeRequirements(uint64_t slice_index) const;

    /** Name of the first proposed term different from the offer */
    boost::optional<std::string_view> conflictingTerm(
        const InitParams &params) const;

    StreamTerms terms_;
    std::string stream_id_;
    StreamState state_{StreamState::kInit};
    uint64_t slice_index_{};
    /// requirement for `slice_index_` is outstanding
    bool pending_{};
    bool settling_{};
    PaymentRequirements requirements_;
    clock::UnixTime expires_at_{};
    UnixTimeMs prepaid_until_{};
    UnixTimeMs next_require_at_{};
    UnixTimeMs last_keepalive_{};
    Document pay_id_;
    Nonce settling_nonce_;
    std::set<Nonce> accepted_nonces_;
  };
}  // namespace x402::stream
