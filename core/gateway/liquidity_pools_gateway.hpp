/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/message_processor.hpp"

#include <memory>
#include <vector>

#include "gateway/admin_origin.hpp"
#include "gateway/gateway_config.hpp"
#include "gateway/gateway_events.hpp"
#include "gateway/gateway_storage.hpp"
#include "gateway/message_queue.hpp"
#include "gateway/message_sender.hpp"
#include "gateway/outbound_batcher.hpp"
#include "gateway/quorum_engine.hpp"
#include "gateway/router_registry.hpp"
#include "log/logger.hpp"
#include "primitives/origin.hpp"

namespace lpgate::gateway {

  /**
   * Entry point of the gateway. Receives messages from the allowed remote
   * instances, sends local messages out through every router and processes
   * both kinds when the queue hands them back
   */
  class LiquidityPoolsGateway : public MessageProcessor {
   public:
    LiquidityPoolsGateway(GatewayConfig config,
                          std::shared_ptr<GatewayStorage> storage,
                          std::shared_ptr<RouterRegistry> routers,
                          std::shared_ptr<QuorumEngine> quorum,
                          std::shared_ptr<OutboundBatcher> batcher,
                          std::shared_ptr<MessageQueue> queue,
                          std::shared_ptr<MessageSender> sender,
                          std::shared_ptr<AdminOrigin> admin_origin,
                          std::shared_ptr<GatewayEventEmitter> events);

    // -- administration --

    outcome::result<void> setRouters(const primitives::Origin &origin,
                                     std::vector<RouterId> router_ids);

    /// Allows messages from the remote instance
    outcome::result<void> addInstance(
        const primitives::Origin &origin,
        const primitives::DomainAddress &instance);

    outcome::result<void> removeInstance(
        const primitives::Origin &origin,
        const primitives::DomainAddress &instance);

    /**
     * Counts a proof of a stuck message on behalf of a secondary router
     */
    outcome::result<void> executeMessageRecovery(
        const primitives::Origin &origin,
        const primitives::DomainAddress &domain_address,
        const MessageProof &proof,
        const RouterId &router_id);

    // -- inbound --

    /**
     * Accepts bytes delivered by a router and queues them for processing
     * @param origin_address remote instance that sent the message
     */
    outcome::result<void> receiveMessage(
        const primitives::DomainAddress &origin_address,
        const RouterId &router_id,
        common::BufferView bytes);

    // -- outbound --

    outcome::result<void> startBatchMessage(
        const primitives::Origin &origin,
        const primitives::Domain &destination);

    /// Closes the batch and queues it if anything was packed
    outcome::result<void> endBatchMessage(
        const primitives::Origin &origin,
        const primitives::Domain &destination);

    /**
     * Sends the message to the destination, or packs it if the sender has
     * a batch open for that destination
     */
    outcome::result<void> handle(const primitives::AccountId &sender,
                                 const primitives::Domain &destination,
                                 const Message &message);

    /**
     * Queues the message for the primary router and its proof for the
     * other routers
     */
    outcome::result<void> queueOutboundMessage(
        const primitives::Domain &destination, const Message &message);

    // -- processing --

    ProcessResult process(const GatewayMessage &message) override;

    Weight maxProcessingWeight(const GatewayMessage &message) const override;

   private:
    ProcessResult processOutbound(const OutboundGatewayMessage &message);

    const GatewayConfig config_;
    std::shared_ptr<GatewayStorage> storage_;
    std::shared_ptr<RouterRegistry> routers_;
    std::shared_ptr<QuorumEngine> quorum_;
    std::shared_ptr<OutboundBatcher> batcher_;
    std::shared_ptr<MessageQueue> queue_;
    std::shared_ptr<MessageSender> sender_;
    std::shared_ptr<AdminOrigin> admin_origin_;
    std::shared_ptr<GatewayEventEmitter> events_;
    log::Logger logger_;
  };

}  // namespace lpgate::gateway
