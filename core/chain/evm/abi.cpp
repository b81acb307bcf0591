/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/evm/abi.hpp"

#include "chain/chain_client.hpp"
#include "common/span.hpp"
#include "crypto/keccak/keccak.hpp"

namespace x402::chain::evm::abi {
  using common::Hash256;
  using primitives::toWord;

  namespace {
    constexpr size_t kWord = Hash256::size();
    constexpr uint8_t kEthVOffset = 27;

    void appendAddress(Bytes &out, const Address &address) {
      out.insert(out.end(), kWord - address.size(), 0);
      append(out, address);
    }

    void appendWord(Bytes &out, const Hash256 &word) {
      append(out, word);
    }

    Bytes call(std::string_view signature) {
      auto sel{selector(signature)};
      return {sel.begin(), sel.end()};
    }
  }  // namespace

  BytesN<4> selector(std::string_view signature) {
    auto hash{crypto::keccak::keccak256(common::span::cbytes(signature))};
    BytesN<4> sel;
    std::copy_n(hash.begin(), sel.size(), sel.begin());
    return sel;
  }

  Bytes encodeBalanceOf(const Address &owner) {
    auto data{call(kBalanceOf)};
    appendAddress(data, owner);
    return data;
  }

  Bytes encodeTransferWithAuthorization(
      const payment::ExactEvmPayload &payload) {
    const auto &auth{payload.authorization};
    const auto &sig{payload.signature};
    auto data{call(kTransferWithAuthorization)};
    data.reserve(data.size() + 9 * kWord);
    appendAddress(data, auth.from);
    appendAddress(data, auth.to);
    appendWord(data, toWord(auth.value));
    appendWord(data, toWord(auth.valid_after));
    appendWord(data, toWord(auth.valid_before));
    appendWord(data, auth.nonce);
    uint8_t v = sig[64];
    if (v < kEthVOffset) {
      v += kEthVOffset;
    }
    appendWord(data, toWord(v));
    data.insert(data.end(), sig.begin(), sig.begin() + kWord);
    data.insert(data.end(), sig.begin() + kWord, sig.begin() + 2 * kWord);
    return data;
  }

  outcome::result<UInt256> decodeUint256(BytesIn output) {
    if (output.size() != kWord) {
      return ChainError::kBadResponse;
    }
    return primitives::fromWord(output);
  }
}  // namespace x402::chain::evm::abi
