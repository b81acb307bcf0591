/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "payment/signature.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/payment/test_payer.hpp"

namespace x402::payment {

  class SignatureTest : public testing::Test {
   public:
    void SetUp() override {
      requirements = makeRequirements(
          Network::kBaseSepolia,
          10000,
          "0x209693Bc6afc0C5328bA36FaF03C514EF312287C"_address);
      const auto &token{primitives::usdcDeployment(Network::kBaseSepolia)};
      domain = {token.eip712_name,
                token.eip712_version,
                primitives::chainId(Network::kBaseSepolia),
                requirements.asset};
      payload = payer.pay(requirements, 1740672100, makeNonce(1));
    }

    Hash256 digest() const {
      return eip712::digest(domain, payload.payload.authorization);
    }

    TestPayer payer{1};
    PaymentRequirements requirements;
    eip712::Domain domain;
    PaymentPayload payload;
  };

  /**
   * @given authorization signed by payer
   * @when recovering signer of EIP-712 digest
   * @then payer address
   */
  TEST_F(SignatureTest, RecoverPayer) {
    // key 1
    EXPECT_EQ(payer.address,
              "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"_address);
    auto v{payload.payload.signature[64]};
    EXPECT_TRUE(v == 27 || v == 28);
    EXPECT_OUTCOME_EQ(
        recoverSigner(*payer.secp, digest(), payload.payload.signature),
        payer.address);
  }

  /**
   * @given signature with v as raw recovery id 0/1
   * @when recovering
   * @then same signer as with 27/28
   */
  TEST_F(SignatureTest, RawRecoveryId) {
    auto signature{payload.payload.signature};
    signature[64] = static_cast<uint8_t>(signature[64] - 27);
    EXPECT_OUTCOME_EQ(recoverSigner(*payer.secp, digest(), signature),
                      payer.address);
  }

  /**
   * @given signature with v not in {0, 1, 27, 28}
   * @when recovering
   * @then kInvalidRecoveryId
   */
  TEST_F(SignatureTest, InvalidRecoveryId) {
    auto signature{payload.payload.signature};
    signature[64] = 29;
    EXPECT_OUTCOME_ERROR(SignatureError::kInvalidRecoveryId,
                         recoverSigner(*payer.secp, digest(), signature));
  }

  /**
   * @given authorization altered after signing, or other domain
   * @when recovering
   * @then some address other than payer
   */
  TEST_F(SignatureTest, TamperedMessage) {
    auto authorization{payload.payload.authorization};
    authorization.value += 1;
    auto tampered{recoverSigner(*payer.secp,
                                eip712::digest(domain, authorization),
                                payload.payload.signature)};
    if (tampered) {
      EXPECT_NE(tampered.value(), payer.address);
    }

    auto other_domain{domain};
    other_domain.chain_id = primitives::chainId(Network::kBase);
    auto other{recoverSigner(
        *payer.secp,
        eip712::digest(other_domain, payload.payload.authorization),
        payload.payload.signature)};
    if (other) {
      EXPECT_NE(other.value(), payer.address);
    }
  }

  /**
   * @given domains differing in one field
   * @when computing separators
   * @then separators differ
   */
  TEST_F(SignatureTest, DomainSeparator) {
    auto separator{eip712::domainSeparator(domain)};
    auto renamed{domain};
    renamed.name = "USD Coin";
    EXPECT_NE(eip712::domainSeparator(renamed), separator);
    auto reversioned{domain};
    reversioned.version = "1";
    EXPECT_NE(eip712::domainSeparator(reversioned), separator);
    EXPECT_EQ(eip712::domainSeparator(domain), separator);
  }
}  // namespace x402::payment
