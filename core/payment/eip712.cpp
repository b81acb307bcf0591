/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "payment/eip712.hpp"

#include "common/span.hpp"
#include "crypto/keccak/keccak.hpp"

namespace x402::payment::eip712 {
  using common::span::cbytes;
  using crypto::keccak::keccak256;
  using primitives::toWord;

  namespace {
    constexpr std::string_view kDomainType{
        "EIP712Domain(string name,string version,uint256 chainId,"
        "address verifyingContract)"};
    constexpr std::string_view kTransferType{
        "TransferWithAuthorization(address from,address to,uint256 value,"
        "uint256 validAfter,uint256 validBefore,bytes32 nonce)"};

    /// Address left padded to 32 bytes
    Hash256 addressWord(const Address &address) {
      Hash256 word;
      std::copy(address.begin(), address.end(), word.end() - address.size());
      return word;
    }

    void appendWord(Bytes &out, const Hash256 &word) {
      append(out, word);
    }
  }  // namespace

  Hash256 domainSeparator(const Domain &domain) {
    Bytes encoded;
    encoded.reserve(5 * Hash256::size());
    appendWord(encoded, keccak256(cbytes(kDomainType)));
    appendWord(encoded, keccak256(cbytes(domain.name)));
    appendWord(encoded, keccak256(cbytes(domain.version)));
    appendWord(encoded, toWord(domain.chain_id));
    appendWord(encoded, addressWord(domain.verifying_contract));
    return keccak256(encoded);
  }

  Hash256 structHash(const Authorization &authorization) {
    Bytes encoded;
    encoded.reserve(7 * Hash256::size());
    appendWord(encoded, keccak256(cbytes(kTransferType)));
    appendWord(encoded, addressWord(authorization.from));
    appendWord(encoded, addressWord(authorization.to));
    appendWord(encoded, toWord(authorization.value));
    appendWord(encoded, toWord(authorization.valid_after));
    appendWord(encoded, toWord(authorization.valid_before));
    appendWord(encoded, authorization.nonce);
    return keccak256(encoded);
  }

  Hash256 digest(const Domain &domain, const Authorization &authorization) {
    Bytes encoded{0x19, 0x01};
    appendWord(encoded, domainSeparator(domain));
    appendWord(encoded, structHash(authorization));
    return keccak256(encoded);
  }
}  // namespace x402::payment::eip712
