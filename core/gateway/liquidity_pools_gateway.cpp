/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/liquidity_pools_gateway.hpp"

#include <boost/assert.hpp>

#include "common/visitor.hpp"
#include "gateway/gateway_error.hpp"
#include "gateway/weight.hpp"

namespace lpgate::gateway {

  LiquidityPoolsGateway::LiquidityPoolsGateway(
      GatewayConfig config,
      std::shared_ptr<GatewayStorage> storage,
      std::shared_ptr<RouterRegistry> routers,
      std::shared_ptr<QuorumEngine> quorum,
      std::shared_ptr<OutboundBatcher> batcher,
      std::shared_ptr<MessageQueue> queue,
      std::shared_ptr<MessageSender> sender,
      std::shared_ptr<AdminOrigin> admin_origin,
      std::shared_ptr<GatewayEventEmitter> events)
      : config_{std::move(config)},
        storage_{std::move(storage)},
        routers_{std::move(routers)},
        quorum_{std::move(quorum)},
        batcher_{std::move(batcher)},
        queue_{std::move(queue)},
        sender_{std::move(sender)},
        admin_origin_{std::move(admin_origin)},
        events_{std::move(events)},
        logger_{log::createLogger("LiquidityPoolsGateway", "gateway")} {
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(routers_ != nullptr);
    BOOST_ASSERT(quorum_ != nullptr);
    BOOST_ASSERT(batcher_ != nullptr);
    BOOST_ASSERT(queue_ != nullptr);
    BOOST_ASSERT(sender_ != nullptr);
    BOOST_ASSERT(admin_origin_ != nullptr);
    BOOST_ASSERT(events_ != nullptr);
  }

  outcome::result<void> LiquidityPoolsGateway::setRouters(
      const primitives::Origin &origin, std::vector<RouterId> router_ids) {
    OUTCOME_TRY(admin_origin_->ensureOrigin(origin));
    return routers_->setRouters(std::move(router_ids));
  }

  outcome::result<void> LiquidityPoolsGateway::addInstance(
      const primitives::Origin &origin,
      const primitives::DomainAddress &instance) {
    OUTCOME_TRY(admin_origin_->ensureOrigin(origin));

    if (primitives::isLocal(instance)) {
      return GatewayError::DomainNotSupported;
    }
    OUTCOME_TRY(known, storage_->hasInstance(instance));
    if (known) {
      return GatewayError::InstanceAlreadyAdded;
    }
    OUTCOME_TRY(storage_->putInstance(instance));

    SL_INFO(logger_, "Instance {} added", instance);
    events_->fire(InstanceAdded{instance});
    return outcome::success();
  }

  outcome::result<void> LiquidityPoolsGateway::removeInstance(
      const primitives::Origin &origin,
      const primitives::DomainAddress &instance) {
    OUTCOME_TRY(admin_origin_->ensureOrigin(origin));

    OUTCOME_TRY(known, storage_->hasInstance(instance));
    if (not known) {
      return GatewayError::UnknownInstance;
    }
    OUTCOME_TRY(storage_->removeInstance(instance));

    SL_INFO(logger_, "Instance {} removed", instance);
    events_->fire(InstanceRemoved{instance});
    return outcome::success();
  }

  outcome::result<void> LiquidityPoolsGateway::executeMessageRecovery(
      const primitives::Origin &origin,
      const primitives::DomainAddress &domain_address,
      const MessageProof &proof,
      const RouterId &router_id) {
    OUTCOME_TRY(admin_origin_->ensureOrigin(origin));

    OUTCOME_TRY(
        quorum_->executeMessageRecovery(domain_address, proof, router_id));

    events_->fire(MessageRecoveryExecuted{proof, router_id});
    return outcome::success();
  }

  outcome::result<void> LiquidityPoolsGateway::receiveMessage(
      const primitives::DomainAddress &origin_address,
      const RouterId &router_id,
      common::BufferView bytes) {
    if (primitives::isLocal(origin_address)) {
      return GatewayError::InvalidMessageOrigin;
    }
    OUTCOME_TRY(known, storage_->hasInstance(origin_address));
    if (not known) {
      SL_DEBUG(logger_,
               "Message from unknown instance {} rejected",
               origin_address);
      return GatewayError::UnknownInstance;
    }

    if (bytes.size() > config_.max_incoming_message_size) {
      SL_DEBUG(logger_,
               "Message of {} bytes from {} exceeds {} bytes",
               bytes.size(),
               origin_address,
               config_.max_incoming_message_size);
      return GatewayError::MessageDecodingFailed;
    }
    auto message = Message::deserialize(bytes);
    if (message.has_error()) {
      SL_DEBUG(logger_,
               "Message from {} is malformed: {}",
               origin_address,
               message.error().message());
      return GatewayError::MessageDecodingFailed;
    }

    return queue_->submit(InboundGatewayMessage{
        .domain_address = origin_address,
        .message = std::move(message.value()),
        .router_id = router_id,
    });
  }

  outcome::result<void> LiquidityPoolsGateway::startBatchMessage(
      const primitives::Origin &origin,
      const primitives::Domain &destination) {
    OUTCOME_TRY(sender, primitives::ensureSigned(origin));
    return batcher_->startBatch(sender, destination);
  }

  outcome::result<void> LiquidityPoolsGateway::endBatchMessage(
      const primitives::Origin &origin,
      const primitives::Domain &destination) {
    OUTCOME_TRY(sender, primitives::ensureSigned(origin));
    OUTCOME_TRY(packed, batcher_->endBatch(sender, destination));
    if (not packed.has_value()) {
      return outcome::success();
    }
    return queueOutboundMessage(destination, packed.value());
  }

  outcome::result<void> LiquidityPoolsGateway::handle(
      const primitives::AccountId &sender,
      const primitives::Domain &destination,
      const Message &message) {
    if (primitives::isLocal(destination)) {
      return GatewayError::DomainNotSupported;
    }

    OUTCOME_TRY(packed, batcher_->packIfStarted(sender, destination, message));
    if (packed) {
      return outcome::success();
    }
    return queueOutboundMessage(destination, message);
  }

  outcome::result<void> LiquidityPoolsGateway::queueOutboundMessage(
      const primitives::Domain &destination, const Message &message) {
    OUTCOME_TRY(router_ids, routers_->routerIdsForDomain(destination));

    // the message goes through the first router, the proof through the rest
    const auto proof_message = message.toProofMessage();
    bool first = true;
    for (const auto &router_id : router_ids) {
      OUTCOME_TRY(queue_->submit(OutboundGatewayMessage{
          .sender = config_.sender,
          .message = first ? message : proof_message,
          .router_id = router_id,
      }));
      first = false;
    }

    SL_DEBUG(logger_,
             "Message {} to {} queued for {} routers",
             message,
             destination,
             router_ids.size());
    return outcome::success();
  }

  ProcessResult LiquidityPoolsGateway::process(const GatewayMessage &message) {
    return visit_in_place(
        message,
        [&](const InboundGatewayMessage &inbound) {
          return quorum_->process(
              inbound.domain_address, inbound.message, inbound.router_id);
        },
        [&](const OutboundGatewayMessage &outbound) {
          return processOutbound(outbound);
        });
  }

  Weight LiquidityPoolsGateway::maxProcessingWeight(
      const GatewayMessage &message) const {
    return visit_in_place(
        message,
        [&](const InboundGatewayMessage &inbound) {
          return processingWeight(config_.defensive_weight,
                                  inbound.message.submessages().size());
        },
        [&](const OutboundGatewayMessage &) {
          return config_.defensive_weight;
        });
  }

  ProcessResult LiquidityPoolsGateway::processOutbound(
      const OutboundGatewayMessage &message) {
    auto res = sender_->send(
        message.router_id, message.sender, message.message.serialize());
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Sending {} via router {} failed: {}",
               message.message,
               message.router_id,
               res.error().message());
    }
    return {.result = std::move(res), .weight = config_.defensive_weight};
  }

}  // namespace lpgate::gateway
