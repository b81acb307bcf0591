/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "common/outcome.hpp"

namespace x402 {
  template <typename T>
  using CbT = std::function<void(outcome::result<T>)>;
}  // namespace x402
