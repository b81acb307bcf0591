/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "payment/reason.hpp"
#include "primitives/network.hpp"

namespace x402::payment {
  using common::Blob;
  using common::Hash256;
  using primitives::Network;
  using primitives::UInt256;
  using primitives::address::Address;

  constexpr auto kSchemeExact{"exact"};
  constexpr uint64_t kX402Version{1};

  /// r || s || v
  using Signature = Blob<65>;
  using Nonce = Hash256;
  using TxHash = Hash256;

  /**
   * EIP-712 domain name and version of the token, carried in `extra` of
   * requirements
   */
  struct TokenExtra {
    std::string name;
    std::string version;
  };

  /**
   * What a resource server asks to be paid for one access
   */
  struct PaymentRequirements {
    std::string scheme{kSchemeExact};
    Network network{};
    UInt256 max_amount_required;
    std::string resource;
    std::string description;
    std::string mime_type;
    Address pay_to;
    uint64_t max_timeout_seconds{};
    Address asset;
    boost::optional<TokenExtra> extra;
  };

  /**
   * EIP-3009 TransferWithAuthorization message
   */
  struct Authorization {
    Address from;
    Address to;
    UInt256 value;
    /// unix seconds
    UInt256 valid_after;
    UInt256 valid_before;
    Nonce nonce;
  };

  struct ExactEvmPayload {
    Signature signature;
    Authorization authorization;
  };

  struct PaymentPayload {
    uint64_t x402_version{kX402Version};
    std::string scheme{kSchemeExact};
    Network network{};
    ExactEvmPayload payload;
  };

  struct VerifyRequest {
    uint64_t x402_version{kX402Version};
    PaymentPayload payment_payload;
    PaymentRequirements payment_requirements;
  };

  using SettleRequest = VerifyRequest;

  struct VerifyResponse {
    static VerifyResponse valid(const Address &payer) {
      return {true, payer, boost::none};
    }

    static VerifyResponse invalid(boost::optional<Address> payer,
                                  Reason reason) {
      return {false, std::move(payer), reason};
    }

    bool is_valid{};
    boost::optional<Address> payer;
    boost::optional<Reason> invalid_reason;
  };

  struct SettleResponse {
    bool success{};
    boost::optional<Address> payer;
    boost::optional<TxHash> transaction;
    Network network{};
    boost::optional<Reason> error_reason;
  };

  /**
   * One (version, scheme, network) combination the facilitator serves
   */
  struct SupportedKind {
    uint64_t x402_version{kX402Version};
    std::string scheme{kSchemeExact};
    Network network{};
  };

  struct SupportedResponse {
    std::vector<SupportedKind> kinds;
  };
}  // namespace x402::payment
