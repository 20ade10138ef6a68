/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "gateway/gateway_events.hpp"
#include "gateway/gateway_storage.hpp"
#include "gateway/types.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /**
   * Ordered list of routers every message and its proofs travel through.
   * The first router is the primary one, it is the only one to carry full
   * messages. Each change of the list opens a new session
   */
  class RouterRegistry {
   public:
    RouterRegistry(std::shared_ptr<GatewayStorage> storage,
                   std::shared_ptr<GatewayEventEmitter> events);

    /**
     * Replaces the router list and increments the session id
     * @return DuplicateRouter if a router is listed twice
     */
    outcome::result<void> setRouters(std::vector<RouterId> router_ids);

    /**
     * Routers serving the domain. All routers serve every domain
     * @return NotEnoughRoutersForDomain if none is configured
     */
    outcome::result<std::vector<RouterId>> routerIdsForDomain(
        const primitives::Domain &domain) const;

    /// Proofs required to execute one message: one per secondary router
    static outcome::result<uint32_t> expectedProofCount(
        const std::vector<RouterId> &router_ids);

    outcome::result<SessionId> sessionId() const;

   private:
    std::shared_ptr<GatewayStorage> storage_;
    std::shared_ptr<GatewayEventEmitter> events_;
    log::Logger logger_;
  };

}  // namespace lpgate::gateway
