/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/local_signer.hpp"

#include <boost/filesystem.hpp>
#include <fstream>
#include <gtest/gtest.h>

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace x402::chain {
  using crypto::secp256k1::Secp256k1ProviderImpl;

  class LocalSignerTest : public testing::Test {
   public:
    void SetUp() override {
      path = boost::filesystem::temp_directory_path()
             / boost::filesystem::unique_path();
    }

    void TearDown() override {
      boost::filesystem::remove(path);
    }

    void writeKey(std::string_view text) const {
      std::ofstream{path.string()} << text;
    }

    std::shared_ptr<Secp256k1ProviderImpl> secp{
        std::make_shared<Secp256k1ProviderImpl>()};
    boost::filesystem::path path;
  };

  /**
   * @given key file with 0x prefix and trailing newline
   * @when loading signer
   * @then address derived from key
   */
  TEST_F(LocalSignerTest, FromFile) {
    writeKey(
        "0x0000000000000000000000000000000000000000000000000000000000000001\n");
    EXPECT_OUTCOME_TRUE(signer, LocalSigner::fromFile(secp, path.string()));
    EXPECT_EQ(signer->address(),
              "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"_address);
  }

  /**
   * @given missing file, non hex content, zero key
   * @when loading signer
   * @then kCannotReadKeyFile or kInvalidKey
   */
  TEST_F(LocalSignerTest, Errors) {
    EXPECT_OUTCOME_ERROR(LocalSignerError::kCannotReadKeyFile,
                         LocalSigner::fromFile(secp, path.string()));
    writeKey("not a key");
    EXPECT_OUTCOME_ERROR(LocalSignerError::kInvalidKey,
                         LocalSigner::fromFile(secp, path.string()));
    writeKey(std::string(64, '0'));
    EXPECT_OUTCOME_ERROR(LocalSignerError::kInvalidKey,
                         LocalSigner::fromFile(secp, path.string()));
  }

  /**
   * @given signer
   * @when signing digest
   * @then signature recovers to signer address
   */
  TEST_F(LocalSignerTest, Sign) {
    crypto::secp256k1::PrivateKey key{};
    key[31] = 2;
    EXPECT_OUTCOME_TRUE(signer, LocalSigner::make(secp, key));
    auto digest{
        "1111111111111111111111111111111111111111111111111111111111111111"_hash256};
    EXPECT_OUTCOME_TRUE(signature, signer->sign(digest));
    EXPECT_OUTCOME_TRUE(public_key, secp->recoverPublicKey(digest, signature));
    EXPECT_OUTCOME_EQ(payment::Address::makeFromPublicKey(public_key),
                      signer->address());
  }
}  // namespace x402::chain
