/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/bytes.hpp"
#include "primitives/big_int.hpp"

namespace x402::codec::rlp {
  using primitives::UInt256;

  /**
   * Encodes Ethereum RLP.
   * Items are appended to the current list, `list()` creates a nested list
   * substream which is appended with `<<`.
   */
  class RlpEncodeStream {
   public:
    /** Encodes byte string */
    RlpEncodeStream &operator<<(BytesIn bytes);
    /** Encodes byte string */
    RlpEncodeStream &operator<<(const Bytes &bytes);
    /** Encodes string */
    RlpEncodeStream &operator<<(std::string_view str);
    /** Encodes integer as minimal big-endian byte string, zero is empty */
    RlpEncodeStream &operator<<(const UInt256 &num);
    RlpEncodeStream &operator<<(uint64_t num);
    /** Encodes nested list */
    RlpEncodeStream &operator<<(const RlpEncodeStream &list);

    /** Returns encoded items without list header */
    const Bytes &payload() const;
    /** Returns the stream encoded as list */
    Bytes list() const;

   private:
    Bytes payload_;
  };

  /** Encodes single byte string item */
  Bytes encode(BytesIn bytes);
}  // namespace x402::codec::rlp
