/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "facilitator/verifier.hpp"

#include "payment/eip712.hpp"
#include "payment/signature.hpp"

namespace x402::facilitator {
  using payment::UInt256;

  NonceKey nonceKey(const PaymentRequirements &requirements,
                    const PaymentPayload &payload) {
    return {requirements.network,
            requirements.asset,
            payload.payload.authorization.nonce};
  }

  PaymentVerifier::PaymentVerifier(std::shared_ptr<NetworkRegistry> registry,
                                   std::shared_ptr<ReplayGuard> replay_guard,
                                   std::shared_ptr<Secp256k1Provider> secp,
                                   std::chrono::seconds skew)
      : registry_{std::move(registry)},
        replay_guard_{std::move(replay_guard)},
        secp_{std::move(secp)},
        skew_{skew} {}

  VerifyResponse PaymentVerifier::check(
      const PaymentRequirements &requirements,
      const PaymentPayload &payload,
      UnixTime now) const {
    const auto &auth{payload.payload.authorization};
    auto invalid{[&](Reason reason) {
      return VerifyResponse::invalid(auth.from, reason);
    }};

    if (payload.x402_version != payment::kX402Version) {
      return invalid(Reason::kInvalidPayload);
    }
    if (requirements.scheme != payment::kSchemeExact
        || payload.scheme != payment::kSchemeExact) {
      return invalid(Reason::kSchemeMismatch);
    }

    if (payload.network != requirements.network) {
      return invalid(Reason::kNetworkMismatch);
    }
    const auto *entry{registry_->find(requirements.network)};
    if (entry == nullptr) {
      return invalid(Reason::kNetworkMismatch);
    }
    if (requirements.asset != entry->token.address) {
      return invalid(Reason::kAssetMismatch);
    }
    if (auth.to != requirements.pay_to) {
      return invalid(Reason::kReceiverMismatch);
    }

    const UInt256 now_s{static_cast<uint64_t>(now.count())};
    const UInt256 skew_s{static_cast<uint64_t>(skew_.count())};
    if (auth.valid_after > now_s + skew_s) {
      return invalid(Reason::kNotYetValid);
    }
    if (now_s > auth.valid_before) {
      return invalid(Reason::kExpired);
    }

    if (auth.value < requirements.max_amount_required) {
      return invalid(Reason::kInsufficientValue);
    }

    payment::eip712::Domain domain{entry->token.eip712_name,
                                   entry->token.eip712_version,
                                   entry->chain_id,
                                   requirements.asset};
    if (requirements.extra) {
      domain.name = requirements.extra->name;
      domain.version = requirements.extra->version;
    }
    auto signer{payment::recoverSigner(*secp_,
                                       payment::eip712::digest(domain, auth),
                                       payload.payload.signature)};
    if (!signer || signer.value() != auth.from) {
      return invalid(Reason::kInvalidSignature);
    }

    if (replay_guard_->isCommitted(nonceKey(requirements, payload))) {
      return invalid(Reason::kNonceReused);
    }

    return VerifyResponse::valid(auth.from);
  }

  void PaymentVerifier::verify(const PaymentRequirements &requirements,
                               const PaymentPayload &payload,
                               UnixTime now,
                               bool check_balance,
                               CbT<VerifyResponse> cb) const {
    auto response{check(requirements, payload, now)};
    if (!response.is_valid || !check_balance) {
      return cb(std::move(response));
    }
    const auto &auth{payload.payload.authorization};
    registry_->find(requirements.network)
        ->client->getBalance(
            auth.from,
            requirements.asset,
            [from{auth.from}, value{auth.value}, response, cb{std::move(cb)}](
                outcome::result<UInt256> _balance) {
              OUTCOME_CB(auto balance, _balance);
              if (balance < value) {
                return cb(VerifyResponse::invalid(
                    from, Reason::kInsufficientBalance));
              }
              cb(response);
            });
  }
}  // namespace x402::facilitator
