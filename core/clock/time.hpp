/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace x402::clock {
  using UnixTime = std::chrono::seconds;
  using UnixTimeMs = std::chrono::milliseconds;
  using std::chrono::microseconds;
}  // namespace x402::clock
