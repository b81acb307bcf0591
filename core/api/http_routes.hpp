/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/server.hpp"
#include "facilitator/facilitator.hpp"

namespace x402::api {
  /**
   * Plain HTTP facilitator endpoints:
   * GET /supported, GET|POST /verify, GET|POST /settle
   */
  void setupFacilitatorRoutes(
      Routes &routes, std::shared_ptr<facilitator::Facilitator> facilitator);
}  // namespace x402::api
