/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/evm/transaction.hpp"

#include "codec/rlp/rlp_encode_stream.hpp"
#include "crypto/keccak/keccak.hpp"

namespace x402::chain::evm {
  using codec::rlp::RlpEncodeStream;

  namespace {
    RlpEncodeStream fields(const LegacyTransaction &tx) {
      RlpEncodeStream s;
      s << tx.nonce << tx.gas_price << tx.gas_limit << BytesIn{tx.to}
        << tx.value << tx.data;
      return s;
    }

    /// Strips leading zeros of signature scalar
    UInt256 scalar(BytesIn bytes) {
      return primitives::fromWord(bytes).value();
    }
  }  // namespace

  common::Hash256 LegacyTransaction::signingHash() const {
    auto s{fields(*this)};
    s << chain_id << uint64_t{0} << uint64_t{0};
    return crypto::keccak::keccak256(s.list());
  }

  Bytes LegacyTransaction::encodeSigned(
      const crypto::secp256k1::Signature &signature) const {
    BytesIn sig{signature};
    auto s{fields(*this)};
    s << UInt256{chain_id} * 2 + 35 + signature[64]
      << scalar(sig.subspan(0, 32)) << scalar(sig.subspan(32, 32));
    return s.list();
  }

  common::Hash256 transactionHash(BytesIn raw) {
    return crypto::keccak::keccak256(raw);
  }
}  // namespace x402::chain::evm
