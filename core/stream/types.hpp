/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "api/envelope.hpp"
#include "clock/time.hpp"
#include "payment/payment_codec.hpp"

namespace x402::stream {
  using api::Document;
  using api::Notification;
  using clock::UnixTimeMs;
  using payment::PaymentPayload;
  using payment::PaymentRequirements;
  using payment::Reason;
  using payment::SettleResponse;
  using payment::VerifyRequest;
  using payment::VerifyResponse;
  using primitives::Network;
  using primitives::UInt256;
  using primitives::address::Address;

  constexpr std::string_view kMethodInit{"stream.init"};
  constexpr std::string_view kMethodRequire{"stream.require"};
  constexpr std::string_view kMethodPay{"stream.pay"};
  constexpr std::string_view kMethodAccept{"stream.accept"};
  constexpr std::string_view kMethodReject{"stream.reject"};
  constexpr std::string_view kMethodPause{"stream.pause"};
  constexpr std::string_view kMethodResume{"stream.resume"};
  constexpr std::string_view kMethodEnd{"stream.end"};
  constexpr std::string_view kMethodKeepalive{"stream.keepalive"};

  /// Grace added to unit when requirement expires, seconds
  constexpr uint64_t kRequireExpiryGrace{10};
  /// Added to unit to get requirement maxTimeoutSeconds
  constexpr uint64_t kRequireTimeoutGrace{30};
  /// Upper bound of authorization window grace, seconds
  constexpr uint64_t kMaxWindowGrace{10};

  enum class StreamState {
    kInit,
    kAwaitingPayment,
    kActive,
    kPaused,
    kEnded,
  };

  std::string_view stateName(StreamState state);

  /**
   * Seller offer, same for all streams of the node
   */
  struct StreamTerms {
    Network network{};
    Address asset;
    Address pay_to;
    /// decimal token units, as announced to buyer
    std::string price_per_unit;
    /// smallest token units
    UInt256 amount;
    uint64_t unit_seconds{};
    std::string resource;
    boost::optional<payment::TokenExtra> extra;
    /// fraction into the current unit when next slice is required
    double require_fraction{0.5};
    /// how long an unpaid slice may stay due before pause
    std::chrono::milliseconds ttl{};
    /// allowed validBefore - validAfter above unit, seconds
    uint64_t window_grace{kMaxWindowGrace};
    std::chrono::milliseconds keepalive_interval{};
  };

  /**
   * Resolves token and amount of the offer for network
   */
  outcome::result<StreamTerms> makeTerms(Network network,
                                         std::string_view price_per_unit,
                                         uint64_t unit_seconds,
                                         const Address &pay_to,
                                         std::string resource);

  /**
   * Terms buyer may propose in stream.init, absent fields accept the offer
   */
  struct InitParams {
    boost::optional<Network> network;
    boost::optional<uint64_t> unit_seconds;
    boost::optional<std::string> price_per_unit;
    boost::optional<UInt256> price;
    boost::optional<Address> pay_to;
    boost::optional<Address> asset;
    boost::optional<std::string> resource;
  };

  struct PayParams {
    std::string stream_id;
    uint64_t slice_index{};
    PaymentPayload payment_payload;
    bool verify_only{};
  };

  /**
   * Outbound session message, reply to request with `reply_id` or unsolicited
   * when it is null
   */
  struct Outbound {
    Document reply_id;
    Notification message;
  };

  /**
   * Verify and settle to run for the pending slice
   */
  struct PaymentJob {
    uint64_t slice_index{};
    VerifyRequest request;
    bool settle{};
  };

  struct PaymentResult {
    VerifyResponse verify;
    boost::optional<SettleResponse> settle;
  };

  namespace event {
    struct Init {
      Document id;
      InitParams params;
    };

    struct Pay {
      Document id;
      PayParams params;
    };

    struct PaymentDone {
      uint64_t slice_index{};
      outcome::result<PaymentResult> result{outcome::success(PaymentResult{})};
    };

    /// null id when connection closed
    struct End {
      Document id;
    };

    struct Keepalive {
      Document id;
    };

    struct Tick {};
  }  // namespace event

  using Event = boost::variant<event::Init,
                               event::Pay,
                               event::PaymentDone,
                               event::End,
                               event::Keepalive,
                               event::Tick>;

  /**
   * Outputs of one event
   */
  struct Transition {
    std::vector<Outbound> out;
    boost::optional<PaymentJob> job;
  };

  using codec::json::AsString;
  using codec::json::encode;
  using codec::json::Get;
  using codec::json::JsonError;
  using codec::json::Set;
  using codec::json::Value;

  JSON_ENCODE(StreamState) {
    return encode(stateName(v), allocator);
  }

  JSON_DECODE(InitParams) {
    if (j.IsNull()) {
      return;
    }
    Get(j, "network", v.network);
    Get(j, "unitSeconds", v.unit_seconds);
    Get(j, "pricePerUnit", v.price_per_unit);
    Get(j, "price", v.price);
    Get(j, "payTo", v.pay_to);
    Get(j, "asset", v.asset);
    Get(j, "resource", v.resource);
  }

  JSON_DECODE(PayParams) {
    Get(j, "streamId", v.stream_id);
    Get(j, "sliceIndex", v.slice_index);
    Get(j, "paymentPayload", v.payment_payload);
    boost::optional<bool> verify_only;
    Get(j, "verifyOnly", verify_only);
    v.verify_only = verify_only.value_or(false);
  }

  JSON_ENCODE(PaymentResult) {
    Value j{rapidjson::kObjectType};
    Set(j, "verify", v.verify, allocator);
    Set(j, "settle", v.settle, allocator);
    return j;
  }
}  // namespace x402::stream
