/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace x402::common {
  enum class UnhexError {
    kNonHexInput = 1,
    kOddLength,
  };

  /**
   * @brief Converts bytes to lowercase hex representation without prefix
   * @param bytes - input bytes
   * @return hex string
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts bytes to lowercase hex representation prefixed with "0x",
   * the form used for addresses, hashes and signatures on the wire
   */
  std::string hex0x(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes, "0x" prefix is optional
   * @param hex - hex string of even length
   * @return bytes or error
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /** Strips optional "0x"/"0X" prefix */
  std::string_view strip0x(std::string_view hex);
}  // namespace x402::common

OUTCOME_HPP_DECLARE_ERROR(x402::common, UnhexError);
