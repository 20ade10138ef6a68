/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/gateway_storage.hpp"

#include <memory>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"

namespace lpgate::gateway {

  class GatewayStorageImpl : public GatewayStorage {
   public:
    explicit GatewayStorageImpl(std::shared_ptr<storage::BufferStorage> storage);

    outcome::result<std::vector<RouterId>> getRouters() const override;

    outcome::result<void> putRouters(
        const std::vector<RouterId> &routers) override;

    outcome::result<SessionId> getSessionId() const override;

    outcome::result<void> putSessionId(SessionId session_id) override;

    outcome::result<std::optional<InboundEntry>> getInboundEntry(
        const MessageProof &proof, const RouterId &router_id) const override;

    outcome::result<void> putInboundEntry(const MessageProof &proof,
                                          const RouterId &router_id,
                                          const InboundEntry &entry) override;

    outcome::result<void> removeInboundEntry(
        const MessageProof &proof, const RouterId &router_id) override;

    outcome::result<bool> hasInstance(
        const primitives::DomainAddress &instance) const override;

    outcome::result<void> putInstance(
        const primitives::DomainAddress &instance) override;

    outcome::result<void> removeInstance(
        const primitives::DomainAddress &instance) override;

    outcome::result<std::optional<Message>> getPackedMessage(
        const primitives::AccountId &sender,
        const primitives::Domain &destination) const override;

    outcome::result<void> putPackedMessage(
        const primitives::AccountId &sender,
        const primitives::Domain &destination,
        const Message &message) override;

    outcome::result<void> removePackedMessage(
        const primitives::AccountId &sender,
        const primitives::Domain &destination) override;

   private:
    template <typename T>
    outcome::result<std::optional<T>> getDecoded(
        const common::Buffer &key) const;

    template <typename T>
    outcome::result<void> putEncoded(const common::Buffer &key,
                                     const T &value);

    std::shared_ptr<storage::BufferStorage> storage_;
    log::Logger logger_;
  };

}  // namespace lpgate::gateway
