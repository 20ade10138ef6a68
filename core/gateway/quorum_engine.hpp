/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "gateway/gateway_storage.hpp"
#include "gateway/inbound_entry.hpp"
#include "gateway/inbound_message_handler.hpp"
#include "gateway/message_processor.hpp"
#include "gateway/router_registry.hpp"
#include "log/logger.hpp"
#include "storage/transactional_storage.hpp"

namespace lpgate::gateway {

  /**
   * Collects a message from the primary router and its proofs from the
   * secondary routers, and executes the message once each secondary router
   * confirmed it. Arrival order does not matter
   */
  class QuorumEngine {
   public:
    QuorumEngine(std::shared_ptr<RouterRegistry> routers,
                 std::shared_ptr<GatewayStorage> storage,
                 std::shared_ptr<storage::TransactionalStorage> transactions,
                 std::shared_ptr<InboundMessageHandler> handler,
                 Weight defensive_weight);

    /**
     * Registers every sub-message of `message` received through
     * `router_id` and executes those which reached quorum.
     * Each sub-message is applied atomically, processing stops at the first
     * failing one
     */
    ProcessResult process(const primitives::DomainAddress &domain_address,
                          const Message &message,
                          const RouterId &router_id);

    /**
     * Counts one more proof of `proof` on behalf of a secondary router and
     * executes the message if that completes the quorum
     */
    outcome::result<void> executeMessageRecovery(
        const primitives::DomainAddress &domain_address,
        const MessageProof &proof,
        const RouterId &router_id);

    outcome::result<InboundProcessingInfo> processingInfo(
        const primitives::DomainAddress &domain_address) const;

   private:
    outcome::result<void> processSubmessage(const InboundProcessingInfo &info,
                                            const Message &submessage,
                                            const RouterId &router_id);

    outcome::result<void> upsertPendingEntry(const MessageProof &proof,
                                             const RouterId &router_id,
                                             InboundEntry candidate);

    outcome::result<void> executeIfRequirementsAreMet(
        const InboundProcessingInfo &info, const MessageProof &proof);

    /// Consumes one message worth of counts of every router
    outcome::result<void> executePostVotingDispatch(
        const InboundProcessingInfo &info, const MessageProof &proof);

    std::shared_ptr<RouterRegistry> routers_;
    std::shared_ptr<GatewayStorage> storage_;
    std::shared_ptr<storage::TransactionalStorage> transactions_;
    std::shared_ptr<InboundMessageHandler> handler_;
    const Weight defensive_weight_;
    log::Logger logger_;
  };

}  // namespace lpgate::gateway
