/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>

#include "chain/signer.hpp"
#include "clock/utc_clock.hpp"
#include "common/outcome.hpp"
#include "facilitator/facilitator.hpp"
#include "facilitator/network_registry.hpp"
#include "facilitator/replay_guard.hpp"
#include "facilitator/settlement_engine.hpp"
#include "facilitator/verifier.hpp"
#include "node/main/config.hpp"
#include "stream/stream_session_manager.hpp"

namespace x402::node {
  enum class BuilderError {
    kNoNetworks = 1,
  };

  struct FacilitatorObjects {
    std::shared_ptr<boost::asio::io_context> io_context;
    std::shared_ptr<clock::UTCClock> utc_clock;
    std::shared_ptr<chain::OperationalSigner> signer;

    std::shared_ptr<facilitator::NetworkRegistry> registry;
    std::shared_ptr<facilitator::ReplayGuard> replay_guard;
    std::shared_ptr<facilitator::PaymentVerifier> verifier;
    std::shared_ptr<facilitator::SettlementEngine> settlement_engine;
    std::shared_ptr<facilitator::Facilitator> facilitator;

    /// null when streams are disabled
    std::shared_ptr<stream::StreamSessionManager> stream_manager;
  };

  outcome::result<FacilitatorObjects> createFacilitatorObjects(
      const Config &config);
}  // namespace x402::node

OUTCOME_HPP_DECLARE_ERROR(x402::node, BuilderError);
