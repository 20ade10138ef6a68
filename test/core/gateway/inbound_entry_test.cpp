/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "gateway/inbound_entry.hpp"

#include <limits>

#include "gateway/gateway_error.hpp"
#include "primitives/arithmetic_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace lpgate::gateway;
using lpgate::common::Buffer;
using lpgate::primitives::ArithmeticError;
using lpgate::primitives::EvmDomainAddress;

class InboundEntryTest : public ::testing::Test {
 protected:
  Message message_ = SimpleMessage{Buffer{1, 2, 3}};
  InboundProcessingInfo info_{
      .domain_address = EvmDomainAddress{1, "remote"_evm},
      .router_ids = {"r1"_router, "r2"_router, "r3"_router},
      .current_session_id = 5,
      .expected_proof_count_per_message = 2,
  };
};

TEST_F(InboundEntryTest, MakeInboundEntry) {
  EXPECT_EQ(makeInboundEntry(info_, message_),
            InboundEntry{MessageEntry{5, info_.domain_address, message_, 2}});
  EXPECT_EQ(makeInboundEntry(info_, message_.toProofMessage()),
            InboundEntry{ProofEntry{5, 1}});
}

/**
 * @given router setup of three routers
 * @when entries arrive from various routers
 * @then only the first router may send messages and only the rest may send
 * proofs
 */
TEST_F(InboundEntryTest, ValidateRouterRoles) {
  InboundEntry message = makeInboundEntry(info_, message_);
  InboundEntry proof = makeInboundEntry(info_, message_.toProofMessage());

  ASSERT_OUTCOME_SUCCESS_TRY(validateInboundEntry(message, info_, "r1"_router));
  ASSERT_OUTCOME_SUCCESS_TRY(validateInboundEntry(proof, info_, "r3"_router));

  ASSERT_OUTCOME_ERROR(validateInboundEntry(message, info_, "r2"_router),
                       GatewayError::MessageExpectedFromFirstRouter);
  ASSERT_OUTCOME_ERROR(validateInboundEntry(proof, info_, "r1"_router),
                       GatewayError::ProofNotExpectedFromFirstRouter);
  ASSERT_OUTCOME_ERROR(validateInboundEntry(proof, info_, "r4"_router),
                       GatewayError::UnknownRouter);
}

TEST_F(InboundEntryTest, PreDispatchUpdateSameSession) {
  InboundEntry message = MessageEntry{5, info_.domain_address, message_, 2};
  ASSERT_OUTCOME_SUCCESS_TRY(
      preDispatchUpdate(message, makeInboundEntry(info_, message_)));
  EXPECT_EQ(std::get<MessageEntry>(message).expected_proof_count, 4);

  InboundEntry proof = ProofEntry{5, 1};
  ASSERT_OUTCOME_SUCCESS_TRY(preDispatchUpdate(proof, ProofEntry{5, 1}));
  EXPECT_EQ(proof, InboundEntry{ProofEntry{5, 2}});
}

TEST_F(InboundEntryTest, PreDispatchUpdateReplacesStaleSession) {
  InboundEntry proof = ProofEntry{4, 7};
  ASSERT_OUTCOME_SUCCESS_TRY(preDispatchUpdate(proof, ProofEntry{5, 1}));
  EXPECT_EQ(proof, InboundEntry{ProofEntry{5, 1}});

  InboundEntry message = MessageEntry{4, info_.domain_address, message_, 6};
  ASSERT_OUTCOME_SUCCESS_TRY(
      preDispatchUpdate(message, makeInboundEntry(info_, message_)));
  EXPECT_EQ(message, makeInboundEntry(info_, message_));
}

TEST_F(InboundEntryTest, PreDispatchUpdateTypeMismatch) {
  InboundEntry message = makeInboundEntry(info_, message_);
  ASSERT_OUTCOME_ERROR(preDispatchUpdate(message, ProofEntry{5, 1}),
                       GatewayError::ExpectedMessageType);

  InboundEntry proof = ProofEntry{5, 1};
  ASSERT_OUTCOME_ERROR(
      preDispatchUpdate(proof, makeInboundEntry(info_, message_)),
      GatewayError::ExpectedMessageProofType);
}

/**
 * @given proof entry with the max count
 * @when another proof of the same session is merged
 * @then overflow is reported and the entry is untouched
 */
TEST_F(InboundEntryTest, PreDispatchUpdateOverflow) {
  constexpr auto kMax = std::numeric_limits<uint32_t>::max();
  InboundEntry proof = ProofEntry{5, kMax};
  ASSERT_OUTCOME_ERROR(preDispatchUpdate(proof, ProofEntry{5, 1}),
                       ArithmeticError::Overflow);
  EXPECT_EQ(proof, InboundEntry{ProofEntry{5, kMax}});
}

TEST_F(InboundEntryTest, IncrementProofCount) {
  InboundEntry proof = ProofEntry{5, 1};
  ASSERT_OUTCOME_SUCCESS_TRY(incrementProofCount(proof, 5));
  EXPECT_EQ(proof, InboundEntry{ProofEntry{5, 2}});

  ASSERT_OUTCOME_SUCCESS_TRY(incrementProofCount(proof, 6));
  EXPECT_EQ(proof, InboundEntry{ProofEntry{6, 1}});

  InboundEntry message = makeInboundEntry(info_, message_);
  ASSERT_OUTCOME_ERROR(incrementProofCount(message, 5),
                       GatewayError::ExpectedMessageProofType);
}

TEST_F(InboundEntryTest, HasValidVoteForSession) {
  EXPECT_TRUE((ProofEntry{5, 1}.hasValidVoteForSession(5)));
  EXPECT_FALSE((ProofEntry{5, 0}.hasValidVoteForSession(5)));
  EXPECT_FALSE((ProofEntry{4, 3}.hasValidVoteForSession(5)));
}

/**
 * @given entries holding counts of two messages
 * @when one message is executed
 * @then one message worth of counts is consumed, exhausted and stale entries
 * are dropped
 */
TEST_F(InboundEntryTest, CreatePostVotingEntry) {
  ASSERT_OUTCOME_SUCCESS(
      message_left,
      createPostVotingEntry(MessageEntry{5, info_.domain_address, message_, 4},
                            info_));
  EXPECT_EQ(message_left,
            InboundEntry{MessageEntry{5, info_.domain_address, message_, 2}});

  ASSERT_OUTCOME_SUCCESS(
      message_done,
      createPostVotingEntry(MessageEntry{5, info_.domain_address, message_, 2},
                            info_));
  EXPECT_EQ(message_done, std::nullopt);

  ASSERT_OUTCOME_SUCCESS(proof_left,
                         createPostVotingEntry(ProofEntry{5, 2}, info_));
  EXPECT_EQ(proof_left, InboundEntry{ProofEntry{5, 1}});

  ASSERT_OUTCOME_SUCCESS(proof_done,
                         createPostVotingEntry(ProofEntry{5, 1}, info_));
  EXPECT_EQ(proof_done, std::nullopt);

  ASSERT_OUTCOME_SUCCESS(stale,
                         createPostVotingEntry(ProofEntry{4, 3}, info_));
  EXPECT_EQ(stale, std::nullopt);

  ASSERT_OUTCOME_ERROR(
      createPostVotingEntry(MessageEntry{5, info_.domain_address, message_, 1},
                            info_),
      ArithmeticError::Underflow);
  ASSERT_OUTCOME_ERROR(createPostVotingEntry(ProofEntry{5, 0}, info_),
                       ArithmeticError::Underflow);
}
