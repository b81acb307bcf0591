/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/evm/transaction.hpp"

#include <gtest/gtest.h>

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "testutil/literals.hpp"

namespace x402::chain::evm {
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::Secp256k1ProviderImpl;

  class TransactionTest : public testing::Test {
   public:
    void SetUp() override {
      tx.nonce = 9;
      tx.gas_price = UInt256{20000000000};
      tx.gas_limit = 21000;
      tx.to = "0x3535353535353535353535353535353535353535"_address;
      tx.value = UInt256{1000000000000000000};
      tx.chain_id = 1;
    }

    LegacyTransaction tx;
  };

  /**
   * @given example transaction from EIP-155
   * @when computing signing hash
   * @then hash over fields with chain id, 0, 0
   */
  TEST_F(TransactionTest, SigningHash) {
    EXPECT_EQ(
        tx.signingHash(),
        "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53"_hash256);
  }

  /**
   * @given example transaction and key 0x4646..46 from EIP-155
   * @when signing and encoding
   * @then raw transaction with v = chainId * 2 + 35 + recovery id
   */
  TEST_F(TransactionTest, EncodeSigned) {
    Secp256k1ProviderImpl secp;
    PrivateKey key;
    key.fill(0x46);
    auto signature{secp.sign(tx.signingHash(), key).value()};
    auto raw{tx.encodeSigned(signature)};
    EXPECT_EQ(
        raw,
        "f86c098504a817c800825208943535353535353535353535353535353535353535"
        "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c71"
        "ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc6421"
        "4b297fb1966a3b6d83"_unhex);
    EXPECT_EQ(
        transactionHash(raw),
        "33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788"_hash256);
  }
}  // namespace x402::chain::evm
