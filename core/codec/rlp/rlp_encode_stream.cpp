/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/rlp/rlp_encode_stream.hpp"

#include "common/span.hpp"

namespace x402::codec::rlp {
  namespace {
    constexpr uint8_t kShortString = 0x80;
    constexpr uint8_t kLongString = 0xb7;
    constexpr uint8_t kShortList = 0xc0;
    constexpr uint8_t kLongList = 0xf7;
    constexpr size_t kShortMax = 55;

    Bytes bigEndian(uint64_t num) {
      Bytes bytes;
      while (num != 0) {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(num & 0xff));
        num >>= 8;
      }
      return bytes;
    }

    void writeHeader(Bytes &out, size_t length, uint8_t short_base,
                     uint8_t long_base) {
      if (length <= kShortMax) {
        out.push_back(static_cast<uint8_t>(short_base + length));
      } else {
        auto length_bytes{bigEndian(length)};
        out.push_back(static_cast<uint8_t>(long_base + length_bytes.size()));
        append(out, length_bytes);
      }
    }

    void writeString(Bytes &out, BytesIn bytes) {
      if (bytes.size() == 1 && bytes[0] < kShortString) {
        out.push_back(bytes[0]);
        return;
      }
      writeHeader(out, bytes.size(), kShortString, kLongString);
      append(out, bytes);
    }
  }  // namespace

  RlpEncodeStream &RlpEncodeStream::operator<<(BytesIn bytes) {
    writeString(payload_, bytes);
    return *this;
  }

  RlpEncodeStream &RlpEncodeStream::operator<<(const Bytes &bytes) {
    return *this << gsl::make_span(bytes);
  }

  RlpEncodeStream &RlpEncodeStream::operator<<(std::string_view str) {
    return *this << common::span::cbytes(str);
  }

  RlpEncodeStream &RlpEncodeStream::operator<<(const UInt256 &num) {
    Bytes bytes;
    if (num != 0) {
      export_bits(num, std::back_inserter(bytes), 8);
    }
    return *this << bytes;
  }

  RlpEncodeStream &RlpEncodeStream::operator<<(uint64_t num) {
    return *this << bigEndian(num);
  }

  RlpEncodeStream &RlpEncodeStream::operator<<(const RlpEncodeStream &list) {
    append(payload_, list.list());
    return *this;
  }

  const Bytes &RlpEncodeStream::payload() const {
    return payload_;
  }

  Bytes RlpEncodeStream::list() const {
    Bytes out;
    writeHeader(out, payload_.size(), kShortList, kLongList);
    append(out, payload_);
    return out;
  }

  Bytes encode(BytesIn bytes) {
    Bytes out;
    writeString(out, bytes);
    return out;
  }
}  // namespace x402::codec::rlp
