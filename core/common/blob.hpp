/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <string_view>

#include <boost/functional/hash.hpp>

#include "common/hexutil.hpp"

namespace x402::common {
  enum class BlobError { kIncorrectLength = 1 };

  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is usually used to store an arbitrary data, but it is not
   * designed for binary payloads of known length: hashes, nonces, keys
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    using Array = std::array<uint8_t, size_>;

    /** Zero-initialized blob */
    constexpr Blob() : Array{} {}

    explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    /** Lowercase hex without prefix */
    std::string toHex() const noexcept {
      return hex_lower(*this);
    }

    /** Lowercase hex with "0x" prefix */
    std::string toHex0x() const noexcept {
      return hex0x(*this);
    }

    /**
     * Create Blob from arbitrary span of bytes
     * @param span - bytes to copy, must be exactly `size_` long
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (span.size() != size_) {
        return BlobError::kIncorrectLength;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create Blob from hex string, "0x" prefix is optional
     * @param hex string of exactly `2 * size_` hex digits
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }
  };

  using Hash256 = Blob<32>;
}  // namespace x402::common

template <size_t N>
struct std::hash<x402::common::Blob<N>> {
  size_t operator()(const x402::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

OUTCOME_HPP_DECLARE_ERROR(x402::common, BlobError);
