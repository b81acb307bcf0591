/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <gtest/gtest.h>

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "primitives/address/address_codec.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace x402::primitives::address {
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::PublicKey;
  using crypto::secp256k1::Secp256k1ProviderImpl;

  /**
   * @given private key 1
   * @when making address from its public key
   * @then well known address
   */
  TEST(AddressTest, FromPublicKey) {
    Secp256k1ProviderImpl secp;
    PrivateKey key{};
    key[31] = 1;
    EXPECT_OUTCOME_TRUE(public_key, secp.derive(key));
    EXPECT_OUTCOME_TRUE(address, Address::makeFromPublicKey(public_key));
    EXPECT_EQ(encodeToString(address),
              "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
  }

  /**
   * @given public key without uncompressed prefix
   * @when making address
   * @then error
   */
  TEST(AddressTest, CompressedPrefixRejected) {
    PublicKey public_key{};
    public_key[0] = 0x02;
    EXPECT_OUTCOME_ERROR(AddressError::kInvalidPublicKey,
                         Address::makeFromPublicKey(public_key));
  }

  /**
   * @given EIP-55 sample address
   * @when decoding lower case, upper case and checksummed forms
   * @then same address, encoded back with checksum
   */
  TEST(AddressCodecTest, Eip55) {
    const std::string checksummed{"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"};
    EXPECT_OUTCOME_TRUE(address, decodeFromString(checksummed));
    EXPECT_EQ(encodeToString(address), checksummed);
    EXPECT_OUTCOME_EQ(
        decodeFromString("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"),
        address);
    EXPECT_OUTCOME_EQ(
        decodeFromString("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED"),
        address);
    EXPECT_OUTCOME_EQ(
        decodeFromString("5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"), address);
  }

  /**
   * @given mixed case address with one letter case flipped
   * @when decoding
   * @then checksum error
   */
  TEST(AddressCodecTest, BadChecksum) {
    EXPECT_OUTCOME_ERROR(
        AddressError::kInvalidChecksum,
        decodeFromString("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD"));
  }

  /**
   * @given strings of wrong length or with non hex characters
   * @when decoding
   * @then length error
   */
  TEST(AddressCodecTest, Malformed) {
    EXPECT_OUTCOME_ERROR(AddressError::kInvalidLength,
                         decodeFromString("0x1234"));
    EXPECT_OUTCOME_ERROR(
        AddressError::kInvalidLength,
        decodeFromString("0xzzzeb6053f3e94c9b9a09f33669435e7ef1beaed"));
  }

  /**
   * @given zero and non zero addresses
   * @when checking isZero
   * @then only zero address is zero
   */
  TEST(AddressTest, IsZero) {
    EXPECT_TRUE(Address{}.isZero());
    EXPECT_FALSE("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"_address.isZero());
  }
}  // namespace x402::primitives::address
