/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/json/coding.hpp"
#include "payment/types.hpp"

namespace x402::common {
  template <size_t N>
  JSON_ENCODE(Blob<N>) {
    return codec::json::encode(v.toHex0x(), allocator);
  }

  template <size_t N>
  JSON_DECODE(Blob<N>) {
    auto blob{Blob<N>::fromHex(codec::json::AsString(j))};
    if (!blob) {
      outcome::raise(codec::json::JsonError::kWrongLength);
    }
    v = blob.value();
  }
}  // namespace x402::common

namespace x402::payment {
  using codec::json::AsString;
  using codec::json::encode;
  using codec::json::Get;
  using codec::json::innerDecode;
  using codec::json::JsonError;
  using codec::json::Set;
  using codec::json::Value;

  JSON_ENCODE(TokenExtra) {
    Value j{rapidjson::kObjectType};
    Set(j, "name", v.name, allocator);
    Set(j, "version", v.version, allocator);
    return j;
  }

  JSON_DECODE(TokenExtra) {
    Get(j, "name", v.name);
    Get(j, "version", v.version);
  }

  JSON_ENCODE(PaymentRequirements) {
    Value j{rapidjson::kObjectType};
    Set(j, "scheme", v.scheme, allocator);
    Set(j, "network", v.network, allocator);
    Set(j, "maxAmountRequired", v.max_amount_required, allocator);
    Set(j, "resource", v.resource, allocator);
    Set(j, "description", v.description, allocator);
    Set(j, "mimeType", v.mime_type, allocator);
    Set(j, "payTo", v.pay_to, allocator);
    Set(j, "maxTimeoutSeconds", v.max_timeout_seconds, allocator);
    Set(j, "asset", v.asset, allocator);
    Set(j, "extra", v.extra, allocator);
    return j;
  }

  JSON_DECODE(PaymentRequirements) {
    Get(j, "scheme", v.scheme);
    Get(j, "network", v.network);
    Get(j, "maxAmountRequired", v.max_amount_required);
    Get(j, "resource", v.resource);
    boost::optional<std::string> description;
    Get(j, "description", description);
    v.description = description.value_or("");
    boost::optional<std::string> mime_type;
    Get(j, "mimeType", mime_type);
    v.mime_type = mime_type.value_or("");
    Get(j, "payTo", v.pay_to);
    Get(j, "maxTimeoutSeconds", v.max_timeout_seconds);
    Get(j, "asset", v.asset);
    Get(j, "extra", v.extra);
  }

  JSON_ENCODE(Authorization) {
    Value j{rapidjson::kObjectType};
    Set(j, "from", v.from, allocator);
    Set(j, "to", v.to, allocator);
    Set(j, "value", v.value, allocator);
    Set(j, "validAfter", v.valid_after, allocator);
    Set(j, "validBefore", v.valid_before, allocator);
    Set(j, "nonce", v.nonce, allocator);
    return j;
  }

  JSON_DECODE(Authorization) {
    Get(j, "from", v.from);
    Get(j, "to", v.to);
    Get(j, "value", v.value);
    Get(j, "validAfter", v.valid_after);
    Get(j, "validBefore", v.valid_before);
    Get(j, "nonce", v.nonce);
  }

  JSON_ENCODE(ExactEvmPayload) {
    Value j{rapidjson::kObjectType};
    Set(j, "signature", v.signature, allocator);
    Set(j, "authorization", v.authorization, allocator);
    return j;
  }

  JSON_DECODE(ExactEvmPayload) {
    Get(j, "signature", v.signature);
    Get(j, "authorization", v.authorization);
  }

  JSON_ENCODE(PaymentPayload) {
    Value j{rapidjson::kObjectType};
    Set(j, "x402Version", v.x402_version, allocator);
    Set(j, "scheme", v.scheme, allocator);
    Set(j, "network", v.network, allocator);
    Set(j, "payload", v.payload, allocator);
    return j;
  }

  JSON_DECODE(PaymentPayload) {
    boost::optional<uint64_t> version;
    Get(j, "x402Version", version);
    v.x402_version = version.value_or(kX402Version);
    Get(j, "scheme", v.scheme);
    Get(j, "network", v.network);
    Get(j, "payload", v.payload);
  }

  JSON_ENCODE(VerifyRequest) {
    Value j{rapidjson::kObjectType};
    Set(j, "x402Version", v.x402_version, allocator);
    Set(j, "paymentPayload", v.payment_payload, allocator);
    Set(j, "paymentRequirements", v.payment_requirements, allocator);
    return j;
  }

  JSON_DECODE(VerifyRequest) {
    boost::optional<uint64_t> version;
    Get(j, "x402Version", version);
    v.x402_version = version.value_or(kX402Version);
    Get(j, "paymentPayload", v.payment_payload);
    Get(j, "paymentRequirements", v.payment_requirements);
  }

  JSON_ENCODE(VerifyResponse) {
    Value j{rapidjson::kObjectType};
    Set(j, "isValid", v.is_valid, allocator);
    Set(j, "payer", v.payer, allocator);
    Set(j, "invalidReason", v.invalid_reason, allocator);
    return j;
  }

  JSON_DECODE(VerifyResponse) {
    Get(j, "isValid", v.is_valid);
    Get(j, "payer", v.payer);
    Get(j, "invalidReason", v.invalid_reason);
  }

  JSON_ENCODE(SettleResponse) {
    Value j{rapidjson::kObjectType};
    Set(j, "success", v.success, allocator);
    Set(j, "payer", v.payer, allocator);
    Set(j, "transaction", v.transaction, allocator);
    Set(j, "network", v.network, allocator);
    Set(j, "errorReason", v.error_reason, allocator);
    return j;
  }

  JSON_DECODE(SettleResponse) {
    Get(j, "success", v.success);
    Get(j, "payer", v.payer);
    Get(j, "transaction", v.transaction);
    Get(j, "network", v.network);
    Get(j, "errorReason", v.error_reason);
  }

  JSON_ENCODE(SupportedKind) {
    Value j{rapidjson::kObjectType};
    Set(j, "x402Version", v.x402_version, allocator);
    Set(j, "scheme", v.scheme, allocator);
    Set(j, "network", v.network, allocator);
    return j;
  }

  JSON_DECODE(SupportedKind) {
    Get(j, "x402Version", v.x402_version);
    Get(j, "scheme", v.scheme);
    Get(j, "network", v.network);
  }

  JSON_ENCODE(SupportedResponse) {
    Value j{rapidjson::kObjectType};
    Set(j, "kinds", v.kinds, allocator);
    return j;
  }

  JSON_DECODE(SupportedResponse) {
    Get(j, "kinds", v.kinds);
  }
}  // namespace x402::payment
