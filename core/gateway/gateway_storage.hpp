/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "gateway/inbound_entry.hpp"
#include "gateway/message.hpp"
#include "gateway/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /**
   * Typed access to the persisted gateway state.
   * Performs no validation of its own
   */
  class GatewayStorage {
   public:
    virtual ~GatewayStorage() = default;

    // -- routers --

    /// Configured routers, empty before the first setup
    virtual outcome::result<std::vector<RouterId>> getRouters() const = 0;

    virtual outcome::result<void> putRouters(
        const std::vector<RouterId> &routers) = 0;

    /// 0 before the first router setup
    virtual outcome::result<SessionId> getSessionId() const = 0;

    virtual outcome::result<void> putSessionId(SessionId session_id) = 0;

    // -- pending inbound entries --

    virtual outcome::result<std::optional<InboundEntry>> getInboundEntry(
        const MessageProof &proof, const RouterId &router_id) const = 0;

    virtual outcome::result<void> putInboundEntry(
        const MessageProof &proof,
        const RouterId &router_id,
        const InboundEntry &entry) = 0;

    virtual outcome::result<void> removeInboundEntry(
        const MessageProof &proof, const RouterId &router_id) = 0;

    // -- allowlist --

    virtual outcome::result<bool> hasInstance(
        const primitives::DomainAddress &instance) const = 0;

    virtual outcome::result<void> putInstance(
        const primitives::DomainAddress &instance) = 0;

    virtual outcome::result<void> removeInstance(
        const primitives::DomainAddress &instance) = 0;

    // -- outbound batches --

    virtual outcome::result<std::optional<Message>> getPackedMessage(
        const primitives::AccountId &sender,
        const primitives::Domain &destination) const = 0;

    virtual outcome::result<void> putPackedMessage(
        const primitives::AccountId &sender,
        const primitives::Domain &destination,
        const Message &message) = 0;

    virtual outcome::result<void> removePackedMessage(
        const primitives::AccountId &sender,
        const primitives::Domain &destination) = 0;
  };

}  // namespace lpgate::gateway
