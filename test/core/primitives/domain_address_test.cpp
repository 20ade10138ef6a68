/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "primitives/domain_address.hpp"

#include "common/blob.hpp"
#include "primitives/origin.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace lpgate::primitives;

TEST(DomainAddressTest, ParseDomain) {
  ASSERT_OUTCOME_SUCCESS(local, parseDomain("local"));
  EXPECT_TRUE(isLocal(local));

  ASSERT_OUTCOME_SUCCESS(evm, parseDomain("evm:42"));
  EXPECT_EQ(evm, Domain{EvmDomain{42}});
  EXPECT_EQ(fmt::format("{}", evm), "evm:42");

  ASSERT_OUTCOME_ERROR(parseDomain("evm"), AddressError::INVALID_FORMAT);
  ASSERT_OUTCOME_ERROR(parseDomain("cosmos:1"), AddressError::INVALID_FORMAT);
  ASSERT_OUTCOME_ERROR(parseDomain("evm:0x1"), AddressError::INVALID_CHAIN_ID);
  ASSERT_OUTCOME_ERROR(parseDomain("evm:"), AddressError::INVALID_CHAIN_ID);
}

/**
 * @given textual addresses
 * @when parsed
 * @then they keep their domain and print back to the same text
 */
TEST(DomainAddressTest, ParseDomainAddress) {
  const std::string evm_text =
      "evm:1:0x" + std::string(38, '0') + "ab";
  ASSERT_OUTCOME_SUCCESS(evm, parseDomainAddress(evm_text));
  ASSERT_TRUE(std::holds_alternative<EvmDomainAddress>(evm));
  EXPECT_EQ(std::get<EvmDomainAddress>(evm).chain_id, 1);
  EXPECT_EQ(std::get<EvmDomainAddress>(evm).address[19], 0xab);
  EXPECT_EQ(domainOf(evm), Domain{EvmDomain{1}});
  EXPECT_FALSE(isLocal(evm));
  EXPECT_EQ(fmt::format("{}", evm), evm_text);

  const std::string local_text = "local:0x" + std::string(64, 'f');
  ASSERT_OUTCOME_SUCCESS(local, parseDomainAddress(local_text));
  EXPECT_TRUE(isLocal(local));
  EXPECT_EQ(fmt::format("{}", local), local_text);

  ASSERT_OUTCOME_ERROR(parseDomainAddress("nothing"),
                       AddressError::INVALID_FORMAT);
  ASSERT_OUTCOME_ERROR(parseDomainAddress("evm:1"),
                       AddressError::INVALID_FORMAT);
  // 32 byte address on an evm domain
  EXPECT_FALSE(
      parseDomainAddress("evm:1:0x" + std::string(64, '0')).has_value());
}

TEST(DomainAddressTest, ScaleLayout) {
  DomainAddress address = EvmDomainAddress{1, "a"_evm};
  ASSERT_OUTCOME_SUCCESS(bytes, scale::encode(address));
  ASSERT_EQ(bytes.size(), 1 + 8 + 20);
  EXPECT_EQ(bytes[0], 1);
  EXPECT_EQ(bytes[1], 1);
  EXPECT_EQ(bytes[9], 'a');

  ASSERT_OUTCOME_SUCCESS(decoded, scale::decode<DomainAddress>(bytes));
  EXPECT_EQ(decoded, address);

  ASSERT_OUTCOME_SUCCESS(local, scale::encode(Domain{LocalDomain{}}));
  EXPECT_EQ(local, (lpgate::common::Buffer{0}));
  EXPECT_FALSE(scale::decode<Domain>(lpgate::common::Buffer{2}).has_value());
}

TEST(OriginTest, EnsureOrigin) {
  Origin root = RootOrigin{};
  Origin signed_origin = SignedOrigin{"alice"_account};

  ASSERT_OUTCOME_SUCCESS_TRY(ensureRoot(root));
  ASSERT_OUTCOME_ERROR(ensureRoot(signed_origin), OriginError::BadOrigin);

  ASSERT_OUTCOME_SUCCESS(account, ensureSigned(signed_origin));
  EXPECT_EQ(account, "alice"_account);
  ASSERT_OUTCOME_ERROR(ensureSigned(root), OriginError::BadOrigin);
}
