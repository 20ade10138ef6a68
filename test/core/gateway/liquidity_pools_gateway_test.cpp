/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "gateway/liquidity_pools_gateway.hpp"

#include "gateway/gateway_error.hpp"
#include "gateway/impl/gateway_storage_impl.hpp"
#include "mock/core/gateway/inbound_message_handler_mock.hpp"
#include "mock/core/gateway/message_queue_mock.hpp"
#include "mock/core/gateway/message_sender_mock.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace lpgate::gateway;
using lpgate::common::Buffer;
using lpgate::primitives::AccountId;
using lpgate::primitives::Domain;
using lpgate::primitives::DomainAddress;
using lpgate::primitives::EvmDomain;
using lpgate::primitives::EvmDomainAddress;
using lpgate::primitives::LocalAddress;
using lpgate::primitives::LocalDomain;
using lpgate::primitives::OriginError;
using lpgate::primitives::RootOrigin;
using lpgate::primitives::SignedOrigin;
using lpgate::storage::InMemoryStorage;
using lpgate::storage::TransactionalStorage;
using testing::_;
using testing::Invoke;
using testing::Return;

namespace {
  constexpr Weight kDefensiveWeight = 7;

  Message simple(uint8_t byte) {
    return SimpleMessage{Buffer{byte}};
  }
}  // namespace

class LiquidityPoolsGatewayTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto transactions =
        std::make_shared<TransactionalStorage>(std::make_shared<InMemoryStorage>());
    storage_ = std::make_shared<GatewayStorageImpl>(transactions);
    events_ = std::make_shared<GatewayEventEmitter>();
    connection_ = events_->subscribe(
        [this](const GatewayEvent &event) { fired_.push_back(event); });

    auto routers = std::make_shared<RouterRegistry>(storage_, events_);
    handler_ = std::make_shared<InboundMessageHandlerMock>();
    auto quorum = std::make_shared<QuorumEngine>(
        routers, storage_, transactions, handler_, kDefensiveWeight);
    auto batcher = std::make_shared<OutboundBatcher>(storage_, 2);
    queue_ = std::make_shared<MessageQueueMock>();
    sender_ = std::make_shared<MessageSenderMock>();

    GatewayConfig config{
        .max_packed_messages = 2,
        .max_incoming_message_size = 8,
        .defensive_weight = kDefensiveWeight,
        .sender = LocalAddress{"gateway"_account},
    };
    gateway_ = std::make_shared<LiquidityPoolsGateway>(config,
                                                       storage_,
                                                       routers,
                                                       quorum,
                                                       batcher,
                                                       queue_,
                                                       sender_,
                                                       std::make_shared<EnsureRoot>(),
                                                       events_);

    ON_CALL(*queue_, submit(_))
        .WillByDefault(Invoke([this](GatewayMessage message) {
          submitted_.emplace_back(std::move(message));
          return outcome::success();
        }));
  }

  void setupRoutersAndInstance() {
    ASSERT_OUTCOME_SUCCESS_TRY(
        gateway_->setRouters(root_, {"r1"_router, "r2"_router}));
    ASSERT_OUTCOME_SUCCESS_TRY(gateway_->addInstance(root_, remote_));
    fired_.clear();
  }

 protected:
  const RootOrigin root_{};
  const SignedOrigin alice_{"alice"_account};
  const DomainAddress remote_ = EvmDomainAddress{1, "remote"_evm};
  const Domain destination_ = EvmDomain{1};

  std::shared_ptr<GatewayStorage> storage_;
  std::shared_ptr<GatewayEventEmitter> events_;
  boost::signals2::scoped_connection connection_;
  std::vector<GatewayEvent> fired_;
  std::shared_ptr<InboundMessageHandlerMock> handler_;
  std::shared_ptr<MessageQueueMock> queue_;
  std::shared_ptr<MessageSenderMock> sender_;
  std::vector<GatewayMessage> submitted_;
  std::shared_ptr<LiquidityPoolsGateway> gateway_;
};

TEST_F(LiquidityPoolsGatewayTest, AdministrationRequiresRoot) {
  ASSERT_OUTCOME_ERROR(gateway_->setRouters(alice_, {"r1"_router}),
                       OriginError::BadOrigin);
  ASSERT_OUTCOME_ERROR(gateway_->addInstance(alice_, remote_),
                       OriginError::BadOrigin);
  ASSERT_OUTCOME_ERROR(gateway_->removeInstance(alice_, remote_),
                       OriginError::BadOrigin);
  ASSERT_OUTCOME_ERROR(gateway_->executeMessageRecovery(
                           alice_, remote_, simple(1).hash(), "r2"_router),
                       OriginError::BadOrigin);
  EXPECT_TRUE(fired_.empty());
}

TEST_F(LiquidityPoolsGatewayTest, Instances) {
  ASSERT_OUTCOME_ERROR(
      gateway_->addInstance(root_, LocalAddress{"alice"_account}),
      GatewayError::DomainNotSupported);
  ASSERT_OUTCOME_ERROR(gateway_->removeInstance(root_, remote_),
                       GatewayError::UnknownInstance);

  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->addInstance(root_, remote_));
  ASSERT_OUTCOME_ERROR(gateway_->addInstance(root_, remote_),
                       GatewayError::InstanceAlreadyAdded);
  ASSERT_OUTCOME_SUCCESS(known, storage_->hasInstance(remote_));
  EXPECT_TRUE(known);

  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->removeInstance(root_, remote_));
  ASSERT_OUTCOME_SUCCESS(after, storage_->hasInstance(remote_));
  EXPECT_FALSE(after);

  ASSERT_EQ(fired_.size(), 2);
  EXPECT_TRUE(std::holds_alternative<InstanceAdded>(fired_[0]));
  EXPECT_TRUE(std::holds_alternative<InstanceRemoved>(fired_[1]));
}

/**
 * @given allowed instance
 * @when various bytes are received from it and from elsewhere
 * @then only decodable messages of allowed remote instances are queued
 */
TEST_F(LiquidityPoolsGatewayTest, ReceiveMessage) {
  setupRoutersAndInstance();
  const auto message = simple(1);

  ASSERT_OUTCOME_ERROR(
      gateway_->receiveMessage(
          LocalAddress{"alice"_account}, "r1"_router, message.serialize()),
      GatewayError::InvalidMessageOrigin);
  ASSERT_OUTCOME_ERROR(
      gateway_->receiveMessage(EvmDomainAddress{2, "remote"_evm},
                               "r1"_router,
                               message.serialize()),
      GatewayError::UnknownInstance);
  ASSERT_OUTCOME_ERROR(
      gateway_->receiveMessage(remote_, "r1"_router, Buffer{7}),
      GatewayError::MessageDecodingFailed);
  ASSERT_OUTCOME_ERROR(
      gateway_->receiveMessage(
          remote_, "r1"_router, Message{SimpleMessage{Buffer(8, 0)}}.serialize()),
      GatewayError::MessageDecodingFailed);

  EXPECT_CALL(*queue_, submit(GatewayMessage{InboundGatewayMessage{
                           remote_, message, "r1"_router}}))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS_TRY(
      gateway_->receiveMessage(remote_, "r1"_router, message.serialize()));
}

/**
 * @given two routers
 * @when a message is sent to a remote domain
 * @then the message is queued for the first router and its proof for the
 * second one
 */
TEST_F(LiquidityPoolsGatewayTest, OutboundFanOut) {
  setupRoutersAndInstance();
  const auto message = simple(1);
  const DomainAddress sender = LocalAddress{"gateway"_account};

  EXPECT_CALL(*queue_, submit(_)).Times(2);
  ASSERT_OUTCOME_SUCCESS_TRY(
      gateway_->handle("alice"_account, destination_, message));

  ASSERT_EQ(submitted_.size(), 2);
  EXPECT_EQ(submitted_[0],
            GatewayMessage{OutboundGatewayMessage{sender, message, "r1"_router}});
  EXPECT_EQ(submitted_[1],
            GatewayMessage{OutboundGatewayMessage{
                sender, message.toProofMessage(), "r2"_router}});
}

TEST_F(LiquidityPoolsGatewayTest, OutboundErrors) {
  EXPECT_CALL(*queue_, submit(_)).Times(0);
  ASSERT_OUTCOME_ERROR(
      gateway_->handle("alice"_account, LocalDomain{}, simple(1)),
      GatewayError::DomainNotSupported);
  ASSERT_OUTCOME_ERROR(
      gateway_->handle("alice"_account, destination_, simple(1)),
      GatewayError::NotEnoughRoutersForDomain);
}

/**
 * @given batch opened by a signed origin
 * @when messages are sent and the batch is closed
 * @then nothing is queued until the end, then the batch is fanned out once
 */
TEST_F(LiquidityPoolsGatewayTest, PackedOutboundMessages) {
  setupRoutersAndInstance();

  ASSERT_OUTCOME_ERROR(gateway_->startBatchMessage(root_, destination_),
                       OriginError::BadOrigin);
  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->startBatchMessage(alice_, destination_));

  EXPECT_CALL(*queue_, submit(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS_TRY(
      gateway_->handle("alice"_account, destination_, simple(1)));
  ASSERT_OUTCOME_SUCCESS_TRY(
      gateway_->handle("alice"_account, destination_, simple(2)));
  ASSERT_OUTCOME_ERROR(
      gateway_->handle("alice"_account, destination_, simple(3)),
      MessageError::BatchLimitReached);
  testing::Mock::VerifyAndClearExpectations(queue_.get());

  EXPECT_CALL(*queue_, submit(_)).Times(2);
  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->endBatchMessage(alice_, destination_));
  ASSERT_EQ(submitted_.size(), 2);
  const Message batch = BatchMessage{{simple(1), simple(2)}};
  EXPECT_EQ(std::get<OutboundGatewayMessage>(submitted_[0]).message, batch);
  EXPECT_EQ(std::get<OutboundGatewayMessage>(submitted_[1]).message,
            batch.toProofMessage());

  ASSERT_OUTCOME_ERROR(gateway_->endBatchMessage(alice_, destination_),
                       GatewayError::MessagePackingNotStarted);
}

TEST_F(LiquidityPoolsGatewayTest, EmptyBatchQueuesNothing) {
  setupRoutersAndInstance();
  EXPECT_CALL(*queue_, submit(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->startBatchMessage(alice_, destination_));
  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->endBatchMessage(alice_, destination_));
}

TEST_F(LiquidityPoolsGatewayTest, ProcessOutbound) {
  const DomainAddress sender = LocalAddress{"gateway"_account};
  const GatewayMessage outbound =
      OutboundGatewayMessage{sender, simple(1), "r1"_router};

  EXPECT_CALL(*sender_, send("r1"_router, sender, _))
      .WillOnce(Invoke([&](auto &&, auto &&, lpgate::common::BufferView bytes) {
        EXPECT_EQ(Buffer(bytes.begin(), bytes.end()), simple(1).serialize());
        return outcome::success();
      }))
      .WillOnce(Return(testutil::DummyError::ERROR));

  auto sent = gateway_->process(outbound);
  ASSERT_OUTCOME_SUCCESS_TRY(sent.result);
  EXPECT_EQ(sent.weight, kDefensiveWeight);

  auto failed = gateway_->process(outbound);
  ASSERT_OUTCOME_ERROR(failed.result, testutil::DummyError::ERROR);
  EXPECT_EQ(failed.weight, kDefensiveWeight);
}

/**
 * @given inbound and outbound gateway messages
 * @when their max processing weight is queried
 * @then inbound is charged per sub-message, outbound once
 */
TEST_F(LiquidityPoolsGatewayTest, MaxProcessingWeight) {
  const GatewayMessage outbound = OutboundGatewayMessage{
      LocalAddress{"gateway"_account}, simple(1), "r1"_router};
  const GatewayMessage inbound =
      InboundGatewayMessage{remote_, simple(1), "r1"_router};
  const GatewayMessage inbound_batch = InboundGatewayMessage{
      remote_, BatchMessage{{simple(1), simple(2), simple(3)}}, "r1"_router};

  EXPECT_EQ(gateway_->maxProcessingWeight(outbound), kDefensiveWeight);
  EXPECT_EQ(gateway_->maxProcessingWeight(inbound), kDefensiveWeight);
  EXPECT_EQ(gateway_->maxProcessingWeight(inbound_batch),
            3 * kDefensiveWeight);
}

/**
 * @given pending inbound message
 * @when the missing proof is recovered through the gateway
 * @then the message is executed and the recovery is announced
 */
TEST_F(LiquidityPoolsGatewayTest, ProcessInboundAndRecover) {
  setupRoutersAndInstance();
  const auto message = simple(1);

  auto pending = gateway_->process(
      InboundGatewayMessage{remote_, message, "r1"_router});
  ASSERT_OUTCOME_SUCCESS_TRY(pending.result);
  EXPECT_EQ(pending.weight, kDefensiveWeight);

  EXPECT_CALL(*handler_, handle(remote_, message))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS_TRY(gateway_->executeMessageRecovery(
      root_, remote_, message.hash(), "r2"_router));

  ASSERT_EQ(fired_.size(), 1);
  ASSERT_TRUE(std::holds_alternative<MessageRecoveryExecuted>(fired_[0]));
  EXPECT_EQ(std::get<MessageRecoveryExecuted>(fired_[0]).proof, message.hash());
}
