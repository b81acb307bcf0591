/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/builder.hpp"

#include "chain/evm/evm_chain_client.hpp"
#include "chain/impl/local_signer.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "facilitator/impl/facilitator_local.hpp"
#include "primitives/address/address_codec.hpp"

namespace x402::node {
  using chain::LocalSigner;
  using chain::evm::EvmChainClient;
  using chain::evm::JsonRpcClient;
  using chain::evm::RpcUrl;
  using crypto::secp256k1::Secp256k1ProviderImpl;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("builder");
      return logger.get();
    }
  }  // namespace

  outcome::result<FacilitatorObjects> createFacilitatorObjects(
      const Config &config) {
    FacilitatorObjects o;
    o.io_context = std::make_shared<boost::asio::io_context>();
    o.utc_clock = std::make_shared<clock::UTCClockImpl>();
    auto secp{std::make_shared<Secp256k1ProviderImpl>()};

    OUTCOME_TRY(signer, LocalSigner::fromFile(secp, config.signer_key_path));
    o.signer = signer;
    log()->info("settlement account {}", o.signer->address());

    std::vector<facilitator::NetworkEntry> entries;
    for (const auto &[network, url] : config.rpc_urls) {
      OUTCOME_TRY(rpc_url, RpcUrl::parse(url));
      auto rpc{std::make_shared<JsonRpcClient>(
          *o.io_context, std::move(rpc_url), config.rpc_timeout)};
      const auto chain_id{primitives::chainId(network)};
      entries.push_back({
          network,
          chain_id,
          primitives::usdcDeployment(network),
          std::make_shared<EvmChainClient>(
              rpc, o.signer, chain_id, config.gas_limit),
      });
      log()->info("serving {} (chain id {})", network, chain_id);
    }
    if (entries.empty()) {
      return BuilderError::kNoNetworks;
    }

    o.registry =
        std::make_shared<facilitator::NetworkRegistry>(std::move(entries));
    o.replay_guard = std::make_shared<facilitator::ReplayGuard>();
    o.verifier = std::make_shared<facilitator::PaymentVerifier>(
        o.registry, o.replay_guard, secp, config.skew);
    o.settlement_engine = std::make_shared<facilitator::SettlementEngine>(
        *o.io_context,
        o.verifier,
        o.registry,
        o.replay_guard,
        o.utc_clock,
        config.poll_interval);
    o.facilitator = std::make_shared<facilitator::FacilitatorLocal>(
        o.registry,
        o.verifier,
        o.settlement_engine,
        o.utc_clock,
        config.check_balance);

    if (config.stream_enabled) {
      OUTCOME_TRY(terms,
                  stream::makeTerms(config.stream_network,
                                    config.price_per_unit,
                                    config.unit_seconds,
                                    config.pay_to,
                                    config.resource));
      terms.require_fraction = config.require_fraction;
      terms.ttl = config.ttl;
      terms.window_grace = config.window_grace;
      terms.keepalive_interval = config.keepalive_interval;
      o.stream_manager = std::make_shared<stream::StreamSessionManager>(
          *o.io_context,
          o.facilitator,
          o.utc_clock,
          std::move(terms),
          config.tick_interval);
    }
    return o;
  }
}  // namespace x402::node

OUTCOME_CPP_DEFINE_CATEGORY(x402::node, BuilderError, e) {
  using E = x402::node::BuilderError;

  switch (e) {
    case E::kNoNetworks:
      return "no network has rpc endpoint";
    default:
      break;
  }
  return "unknown error";
}
