/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/router_registry.hpp"

#include <unordered_set>

#include <boost/assert.hpp>

#include "gateway/gateway_error.hpp"
#include "primitives/math.hpp"

namespace lpgate::gateway {

  RouterRegistry::RouterRegistry(std::shared_ptr<GatewayStorage> storage,
                                 std::shared_ptr<GatewayEventEmitter> events)
      : storage_{std::move(storage)},
        events_{std::move(events)},
        logger_{log::createLogger("RouterRegistry", "gateway")} {
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(events_ != nullptr);
  }

  outcome::result<void> RouterRegistry::setRouters(
      std::vector<RouterId> router_ids) {
    std::unordered_set<RouterId> unique(router_ids.begin(), router_ids.end());
    if (unique.size() != router_ids.size()) {
      return GatewayError::DuplicateRouter;
    }

    OUTCOME_TRY(current_session_id, storage_->getSessionId());
    SessionId session_id = current_session_id;
    OUTCOME_TRY(math::checked_add(session_id, SessionId{1}));

    OUTCOME_TRY(storage_->putRouters(router_ids));
    OUTCOME_TRY(storage_->putSessionId(session_id));

    SL_INFO(logger_,
            "Routers set: {} routers, session {}",
            router_ids.size(),
            session_id);
    events_->fire(RoutersSet{std::move(router_ids), session_id});
    return outcome::success();
  }

  outcome::result<std::vector<RouterId>> RouterRegistry::routerIdsForDomain(
      const primitives::Domain &domain) const {
    OUTCOME_TRY(router_ids, storage_->getRouters());
    if (router_ids.empty()) {
      SL_DEBUG(logger_, "No routers configured for domain {}", domain);
      return GatewayError::NotEnoughRoutersForDomain;
    }
    return router_ids;
  }

  outcome::result<uint32_t> RouterRegistry::expectedProofCount(
      const std::vector<RouterId> &router_ids) {
    if (router_ids.empty()) {
      return GatewayError::NotEnoughRoutersForDomain;
    }
    return static_cast<uint32_t>(router_ids.size() - 1);
  }

  outcome::result<SessionId> RouterRegistry::sessionId() const {
    return storage_->getSessionId();
  }

}  // namespace lpgate::gateway
