/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/stream_session.hpp"

#include <fmt/format.h>

#include "common/visitor.hpp"

namespace x402::stream {
  using api::clone;
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::seconds;

  namespace {
    struct Params {
      Params() : doc{rapidjson::kObjectType} {}

      template <typename T>
      Params &&set(std::string_view key, const T &value) && {
        Set(doc, key, value, doc.GetAllocator());
        return std::move(*this);
      }

      Params &&set(std::string_view key, UnixTimeMs value) && {
        return std::move(*this).set(key, static_cast<int64_t>(value.count()));
      }

      Document doc;
    };

    void emit(Transition &t,
              Document reply_id,
              std::string_view method,
              Params &&params) {
      t.out.push_back(
          {std::move(reply_id),
           Notification{std::string{method}, std::move(params.doc)}});
    }
  }  // namespace

  StreamSession::StreamSession(StreamTerms terms, std::string stream_id)
      : terms_{std::move(terms)}, stream_id_{std::move(stream_id)} {}

  Transition StreamSession::handle(Event event, UnixTimeMs now) {
    Transition t;
    if (state_ == StreamState::kEnded) {
      return t;
    }
    visit_in_place(
        event,
        [&](event::Init &e) { onInit(e, now, t); },
        [&](event::Pay &e) { onPay(e, t); },
        [&](event::PaymentDone &e) { onPaymentDone(e, now, t); },
        [&](event::End &e) { onEnd(e, t); },
        [&](event::Keepalive &e) { onKeepalive(e, now, t); },
        [&](event::Tick &) { onTick(now, t); });
    return t;
  }

  void StreamSession::onInit(event::Init &e, UnixTimeMs now, Transition &t) {
    if (state_ != StreamState::kInit) {
      return reject(
          std::move(e.id), slice_index_, {}, "already_initialized", t);
    }
    if (auto term{conflictingTerm(e.params)}) {
      state_ = StreamState::kEnded;
      return emit(t,
                  std::move(e.id),
                  kMethodEnd,
                  Params{}
                      .set("streamId", stream_id_)
                      .set("reason", std::string_view{"terms_mismatch"})
                      .set("term", *term));
    }
    emit(t,
         std::move(e.id),
         kMethodAccept,
         Params{}
             .set("pricePerUnit", terms_.price_per_unit)
             .set("unitSeconds", terms_.unit_seconds)
             .set("payTo", terms_.pay_to)
             .set("asset", terms_.asset)
             .set("network", terms_.network)
             .set("streamId", stream_id_));
    prepaid_until_ = now;
    next_require_at_ = now;
    last_keepalive_ = now;
    state_ = StreamState::kAwaitingPayment;
    require(now, t);
  }

  void StreamSession::onPay(event::Pay &e, Transition &t) {
    const auto &params{e.params};
    if (state_ == StreamState::kInit) {
      return reject(
          std::move(e.id), params.slice_index, {}, "not_initialized", t);
    }
    if (params.stream_id != stream_id_) {
      return reject(
          std::move(e.id), params.slice_index, {}, "unknown_stream", t);
    }
    if (!pending_ || params.slice_index != slice_index_) {
      return reject(
          std::move(e.id), params.slice_index, {}, "unexpected_slice", t);
    }
    if (settling_) {
      return reject(
          std::move(e.id), params.slice_index, {}, "payment_in_progress", t);
    }
    const auto &auth{params.payment_payload.payload.authorization};
    if (auth.valid_before < auth.valid_after
        || auth.valid_before - auth.valid_after
               > terms_.unit_seconds + terms_.window_grace) {
      return reject(std::move(e.id),
                    params.slice_index,
                    Reason::kInvalidWindow,
                    "authorization window exceeds unit",
                    t);
    }
    if (accepted_nonces_.count(auth.nonce) != 0) {
      return reject(std::move(e.id),
                    params.slice_index,
                    Reason::kNonceReused,
                    "nonce already accepted on this stream",
                    t);
    }
    settling_ = true;
    settling_nonce_ = auth.nonce;
    pay_id_ = std::move(e.id);
    t.job = PaymentJob{
        slice_index_,
        VerifyRequest{
            payment::kX402Version, params.payment_payload, requirements_},
        !params.verify_only,
    };
  }

  void StreamSession::onPaymentDone(event::PaymentDone &e,
                                    UnixTimeMs now,
                                    Transition &t) {
    if (!settling_ || e.slice_index != slice_index_) {
      return;
    }
    settling_ = false;
    if (!e.result) {
      return reject(std::move(pay_id_),
                    e.slice_index,
                    Reason::kRpcUnavailable,
                    e.result.error().message(),
                    t);
    }
    const auto &result{e.result.value()};
    if (!result.verify.is_valid) {
      return reject(
          std::move(pay_id_),
          e.slice_index,
          result.verify.invalid_reason.value_or(Reason::kInvalidPayload),
          "verification failed",
          t);
    }
    if (result.settle && !result.settle->success) {
      return reject(
          std::move(pay_id_),
          e.slice_index,
          result.settle->error_reason.value_or(Reason::kRpcUnavailable),
          "settlement failed",
          t);
    }

    accepted_nonces_.insert(settling_nonce_);
    const milliseconds unit{seconds{terms_.unit_seconds}};
    prepaid_until_ = std::max(prepaid_until_, now) + unit;
    next_require_at_ = prepaid_until_ - unit
                       + duration_cast<milliseconds>(
                           unit * terms_.require_fraction);
    pending_ = false;
    const auto resumed{state_ == StreamState::kPaused};
    state_ = StreamState::kActive;
    emit(t,
         std::move(pay_id_),
         kMethodAccept,
         Params{}
             .set("streamId", stream_id_)
             .set("sliceIndex", e.slice_index)
             .set("verify", result.verify)
             .set("settle", result.settle)
             .set("prepaidUntilMs", prepaid_until_)
             .set("nextRequireAtMs", next_require_at_));
    if (resumed) {
      emit(t,
           {},
           kMethodResume,
           Params{}
               .set("streamId", stream_id_)
               .set("sliceIndex", e.slice_index)
               .set("prepaidUntilMs", prepaid_until_));
    }
  }

  void StreamSession::onEnd(event::End &e, Transition &t) {
    state_ = StreamState::kEnded;
    pending_ = false;
    if (!e.id.IsNull()) {
      emit(t,
           std::move(e.id),
           kMethodEnd,
           Params{}
               .set("streamId", stream_id_)
               .set("reason", std::string_view{"requested"}));
    }
  }

  void StreamSession::onKeepalive(event::Keepalive &e,
                                  UnixTimeMs now,
                                  Transition &t) {
    t.out.push_back({std::move(e.id),
                     Notification{std::string{kMethodKeepalive},
                                  keepaliveParams(now)}});
  }

  void StreamSession::onTick(UnixTimeMs now, Transition &t) {
    if (state_ == StreamState::kInit) {
      return;
    }
    if (state_ == StreamState::kActive && !pending_
        && now >= next_require_at_) {
      ++slice_index_;
      state_ = StreamState::kAwaitingPayment;
      require(now, t);
    } else if (pending_ && !settling_
               && duration_cast<seconds>(now) > expires_at_) {
      // unpaid requirement expired, buyer needs fresh one
      ++slice_index_;
      require(now, t);
    }
    if (state_ == StreamState::kAwaitingPayment && now >= pauseAt()) {
      state_ = StreamState::kPaused;
      emit(t,
           {},
           kMethodPause,
           Params{}
               .set("streamId", stream_id_)
               .set("sliceIndex", slice_index_)
               .set("prepaidUntilMs", prepaid_until_));
    }
    if (terms_.keepalive_interval.count() > 0
        && now - last_keepalive_ >= terms_.keepalive_interval) {
      last_keepalive_ = now;
      t.out.push_back(
          {{},
           Notification{std::string{kMethodKeepalive}, keepaliveParams(now)}});
    }
  }

  UnixTimeMs StreamSession::pauseAt() const {
    // ttl grace applies to the first slice only, paid streams stop at the
    // end of prepaid time
    if (accepted_nonces_.empty()) {
      return std::max(prepaid_until_, next_require_at_ + terms_.ttl);
    }
    return prepaid_until_;
  }

  void StreamSession::require(UnixTimeMs now, Transition &t) {
    requirements_ = makeRequirements(slice_index_);
    expires_at_ = duration_cast<seconds>(now)
                  + seconds{terms_.unit_seconds + kRequireExpiryGrace};
    pending_ = true;
    emit(t,
         {},
         kMethodRequire,
         Params{}
             .set("streamId", stream_id_)
             .set("sliceIndex", slice_index_)
             .set("expiresAt", static_cast<int64_t>(expires_at_.count()))
             .set("requirements", requirements_));
  }

  void StreamSession::reject(Document reply_id,
                             uint64_t slice_index,
                             boost::optional<Reason> reason,
                             std::string_view error,
                             Transition &t) const {
    emit(t,
         std::move(reply_id),
         kMethodReject,
         Params{}
             .set("streamId", stream_id_)
             .set("sliceIndex", slice_index)
             .set("expectedSliceIndex", slice_index_)
             .set("invalidReason", reason)
             .set("error", error));
  }

  Document StreamSession::keepaliveParams(UnixTimeMs now) const {
    return Params{}
        .set("streamId", stream_id_)
        .set("state", state_)
        .set("sliceIndex", slice_index_)
        .set("remainingMs", prepaid_until_ - now)
        .set("prepaidUntilMs", prepaid_until_)
        .set("nextRequireAtMs", next_require_at_)
        .doc;
  }

  PaymentRequirements StreamSession::makeRequirements(
      uint64_t slice_index) const {
    PaymentRequirements requirements;
    requirements.network = terms_.network;
    requirements.max_amount_required = terms_.amount;
    requirements.resource = terms_.resource;
    requirements.description = fmt::format("Slice {}", slice_index);
    requirements.mime_type = "application/octet-stream";
    requirements.pay_to = terms_.pay_to;
    requirements.max_timeout_seconds =
        terms_.unit_seconds + kRequireTimeoutGrace;
    requirements.asset = terms_.asset;
    requirements.extra = terms_.extra;
    return requirements;
  }

  boost::optional<std::string_view> StreamSession::conflictingTerm(
      const InitParams &params) const {
    if (params.network && *params.network != terms_.network) {
      return std::string_view{"network"};
    }
    if (params.unit_seconds && *params.unit_seconds != terms_.unit_seconds) {
      return std::string_view{"unitSeconds"};
    }
    if (params.price && *params.price != terms_.amount) {
      return std::string_view{"price"};
    }
    if (params.price_per_unit) {
      auto amount{primitives::parseTokenAmount(
          *params.price_per_unit,
          primitives::usdcDeployment(terms_.network).decimals)};
      if (!amount || amount.value() != terms_.amount) {
        return std::string_view{"pricePerUnit"};
      }
    }
    if (params.pay_to && *params.pay_to != terms_.pay_to) {
      return std::string_view{"payTo"};
    }
    if (params.asset && *params.asset != terms_.asset) {
      return std::string_view{"asset"};
    }
    return boost::none;
  }
}  // namespace x402::stream
