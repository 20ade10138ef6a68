/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "application/replay_command.hpp"

#include "common/hexutil.hpp"
#include "testutil/outcome.hpp"

using namespace lpgate::application;
using lpgate::common::Buffer;
using lpgate::gateway::Message;
using lpgate::gateway::SimpleMessage;
using lpgate::primitives::Domain;
using lpgate::primitives::EvmDomain;

namespace {
  const std::string kRouter1 = "0x" + std::string(62, '0') + "01";
  const std::string kRouter2 = "0x" + std::string(62, '0') + "02";
  const std::string kAccount = "0x" + std::string(64, 'a');
  const std::string kInstance = "evm:1:0x" + std::string(40, 'b');
}  // namespace

TEST(ReplayCommandTest, SkipsBlankAndComments) {
  ASSERT_OUTCOME_SUCCESS(blank, parseReplayCommand("   "));
  EXPECT_FALSE(blank.has_value());
  ASSERT_OUTCOME_SUCCESS(comment, parseReplayCommand("# receive ..."));
  EXPECT_FALSE(comment.has_value());
}

TEST(ReplayCommandTest, SetRouters) {
  ASSERT_OUTCOME_SUCCESS(
      cmd, parseReplayCommand("set-routers " + kRouter1 + "  " + kRouter2));
  ASSERT_TRUE(cmd.has_value());
  const auto &set = std::get<replay::SetRouters>(cmd.value());
  ASSERT_EQ(set.router_ids.size(), 2);
  EXPECT_EQ(set.router_ids[1][31], 2);
}

/**
 * @given receive line with a hex encoded message
 * @when parsed
 * @then origin, router and raw bytes are kept undecoded
 */
TEST(ReplayCommandTest, Receive) {
  ASSERT_OUTCOME_SUCCESS(
      cmd,
      parseReplayCommand("receive " + kInstance + " " + kRouter1 + " 0x000401"));
  ASSERT_TRUE(cmd.has_value());
  const auto &receive = std::get<replay::Receive>(cmd.value());
  EXPECT_EQ(receive.bytes, (Buffer{0, 4, 1}));
  EXPECT_EQ(receive.router_id[31], 1);
}

TEST(ReplayCommandTest, SendAndBatch) {
  ASSERT_OUTCOME_SUCCESS(
      send, parseReplayCommand("send " + kAccount + " evm:1 0x000401"));
  ASSERT_TRUE(send.has_value());
  const auto &cmd = std::get<replay::Send>(send.value());
  EXPECT_EQ(cmd.destination, Domain{EvmDomain{1}});
  EXPECT_EQ(cmd.message, Message{SimpleMessage{Buffer{1}}});

  ASSERT_OUTCOME_SUCCESS(start,
                         parseReplayCommand("start-batch " + kAccount + " evm:1"));
  ASSERT_TRUE(start.has_value());
  EXPECT_TRUE(std::holds_alternative<replay::StartBatch>(start.value()));

  ASSERT_OUTCOME_SUCCESS(end,
                         parseReplayCommand("end-batch " + kAccount + " evm:1"));
  ASSERT_TRUE(end.has_value());
  EXPECT_TRUE(std::holds_alternative<replay::EndBatch>(end.value()));
}

TEST(ReplayCommandTest, ServiceAndRetry) {
  ASSERT_OUTCOME_SUCCESS(unlimited, parseReplayCommand("service"));
  ASSERT_TRUE(unlimited.has_value());
  EXPECT_EQ(std::get<replay::Service>(unlimited.value()).max_weight,
            std::nullopt);

  ASSERT_OUTCOME_SUCCESS(limited, parseReplayCommand("service 100"));
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(std::get<replay::Service>(limited.value()).max_weight, 100);

  ASSERT_OUTCOME_SUCCESS(retry, parseReplayCommand("retry 3"));
  ASSERT_TRUE(retry.has_value());
  EXPECT_EQ(std::get<replay::Retry>(retry.value()).nonce, 3);
}

TEST(ReplayCommandTest, Errors) {
  ASSERT_OUTCOME_ERROR(parseReplayCommand("jump 1"),
                       ReplayError::UNKNOWN_COMMAND);
  ASSERT_OUTCOME_ERROR(parseReplayCommand("retry"),
                       ReplayError::WRONG_ARGUMENTS_NUMBER);
  ASSERT_OUTCOME_ERROR(parseReplayCommand("retry x1"),
                       ReplayError::INVALID_NUMBER);
  ASSERT_OUTCOME_ERROR(parseReplayCommand("service 1 2"),
                       ReplayError::WRONG_ARGUMENTS_NUMBER);
  EXPECT_FALSE(parseReplayCommand("add-instance evm:1").has_value());
  EXPECT_FALSE(
      parseReplayCommand("send " + kAccount + " evm:1 0x07").has_value());
}
