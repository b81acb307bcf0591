/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace x402::codec::json {
  enum class JsonError {
    kWrongLength = 1,
    kWrongEnum,
    kWrongType,
    kOutOfRange,
    kWrongParams,
    kParseError,
    kFormatError,
  };
}  // namespace x402::codec::json

OUTCOME_HPP_DECLARE_ERROR(x402::codec::json, JsonError);
