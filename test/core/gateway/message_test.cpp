/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "gateway/message.hpp"

#include "crypto/sha/sha256.hpp"
#include "testutil/outcome.hpp"

using lpgate::common::Buffer;
using lpgate::gateway::BatchMessage;
using lpgate::gateway::kMaxBatchMessages;
using lpgate::gateway::Message;
using lpgate::gateway::MessageError;
using lpgate::gateway::MessageProof;
using lpgate::gateway::ProofMessage;
using lpgate::gateway::SimpleMessage;

namespace {
  Message simple(uint8_t byte) {
    return SimpleMessage{Buffer{byte}};
  }
}  // namespace

/**
 * @given simple, proof and batch messages
 * @when they are serialized
 * @then the first byte is the variant index and the body follows
 */
TEST(MessageTest, SerializeLayout) {
  Message message = SimpleMessage{Buffer{1, 2}};
  EXPECT_EQ(message.serialize(), (Buffer{0, 8, 1, 2}));

  MessageProof proof;
  proof.fill(0xaa);
  auto proof_bytes = Message{ProofMessage{proof}}.serialize();
  ASSERT_EQ(proof_bytes.size(), 33);
  EXPECT_EQ(proof_bytes[0], 1);
  EXPECT_EQ(proof_bytes[32], 0xaa);

  Message batch = BatchMessage{{simple(7), simple(8)}};
  EXPECT_EQ(batch.serialize(), (Buffer{2, 8, 0, 4, 7, 0, 4, 8}));
  ASSERT_OUTCOME_SUCCESS(decoded, Message::deserialize(batch.serialize()));
  EXPECT_EQ(decoded, batch);
}

TEST(MessageTest, DeserializeRejectsMalformed) {
  // unknown variant index
  ASSERT_OUTCOME_ERROR(Message::deserialize(Buffer{3}),
                       MessageError::DecodingFailed);
  // truncated payload
  ASSERT_OUTCOME_ERROR(Message::deserialize(Buffer{0, 8, 1}),
                       MessageError::DecodingFailed);
  // batch inside a batch
  ASSERT_OUTCOME_ERROR(Message::deserialize(Buffer{2, 4, 2, 0}),
                       MessageError::DecodingFailed);
  // 17 sub-messages announced
  ASSERT_OUTCOME_ERROR(Message::deserialize(Buffer{2, 17 << 2}),
                       MessageError::DecodingFailed);
}

TEST(MessageTest, HashIsSha256OfEncoding) {
  auto message = simple(1);
  EXPECT_EQ(message.hash(),
            MessageProof{lpgate::crypto::sha256(message.serialize())});
  EXPECT_NE(message.hash(), simple(2).hash());
  EXPECT_EQ(message.proofHash(), std::nullopt);

  Message proof = ProofMessage{message.hash()};
  EXPECT_EQ(proof.proofHash(), message.hash());
}

/**
 * @given a batch of two messages
 * @when its proof message is built
 * @then it is a batch of proofs of each sub-message
 */
TEST(MessageTest, ToProofMessage) {
  EXPECT_EQ(simple(1).toProofMessage(), Message{ProofMessage{simple(1).hash()}});

  Message batch = BatchMessage{{simple(1), simple(2)}};
  Message expected = BatchMessage{{ProofMessage{simple(1).hash()},
                                   ProofMessage{simple(2).hash()}}};
  EXPECT_EQ(batch.toProofMessage(), expected);
}

TEST(MessageTest, Submessages) {
  EXPECT_EQ(simple(1).submessages(), std::vector<Message>{simple(1)});
  EXPECT_TRUE(Message::empty().submessages().empty());
  Message batch = BatchMessage{{simple(1), simple(2)}};
  EXPECT_EQ(batch.submessages(), (std::vector<Message>{simple(1), simple(2)}));
}

TEST(MessageTest, PackWithTurnsIntoBatch) {
  auto message = simple(1);
  ASSERT_OUTCOME_SUCCESS_TRY(message.packWith(simple(2)));
  EXPECT_EQ(message, (Message{BatchMessage{{simple(1), simple(2)}}}));

  ASSERT_OUTCOME_ERROR(message.packWith(Message::empty()),
                       MessageError::NestedBatch);

  auto single = simple(1);
  ASSERT_OUTCOME_ERROR(single.packWith(simple(2), 1),
                       MessageError::BatchLimitReached);
  EXPECT_EQ(single, simple(1));
}

/**
 * @given an empty batch
 * @when more messages than the limit are packed
 * @then the extra message is rejected and the batch keeps the limit
 */
TEST(MessageTest, PackWithLimit) {
  auto batch = Message::empty();
  for (size_t i = 0; i < kMaxBatchMessages; ++i) {
    ASSERT_OUTCOME_SUCCESS_TRY(batch.packWith(simple(i)));
  }
  ASSERT_OUTCOME_ERROR(batch.packWith(simple(0xff)),
                       MessageError::BatchLimitReached);
  EXPECT_EQ(batch.submessages().size(), kMaxBatchMessages);
  EXPECT_EQ(batch.submessages().back(), simple(kMaxBatchMessages - 1));
}
