/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(x402::common, UnhexError, e) {
  using x402::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kOddLength:
      return "Input contains odd number of characters";
  }
  return "Unknown error";
}

namespace x402::common {
  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), back_inserter(res));
    return res;
  }

  std::string hex0x(BytesIn bytes) {
    return "0x" + hex_lower(bytes);
  }

  std::string_view strip0x(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
      hex.remove_prefix(2);
    }
    return hex;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    hex = strip0x(hex);
    if (hex.size() % 2 != 0) {
      return UnhexError::kOddLength;
    }
    Bytes blob;
    blob.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kOddLength;
    }
    return blob;
  }
}  // namespace x402::common
