/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/impl/gateway_storage_impl.hpp"

#include <boost/assert.hpp>

#include "gateway/storage_keys.hpp"

namespace lpgate::gateway {

  GatewayStorageImpl::GatewayStorageImpl(
      std::shared_ptr<storage::BufferStorage> storage)
      : storage_{std::move(storage)},
        logger_{log::createLogger("GatewayStorage", "storage")} {
    BOOST_ASSERT(storage_ != nullptr);
  }

  template <typename T>
  outcome::result<std::optional<T>> GatewayStorageImpl::getDecoded(
      const common::Buffer &key) const {
    OUTCOME_TRY(encoded_opt, storage_->tryGet(key));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(value, scale::decode<T>(encoded_opt.value()));
    return std::move(value);
  }

  template <typename T>
  outcome::result<void> GatewayStorageImpl::putEncoded(
      const common::Buffer &key, const T &value) {
    OUTCOME_TRY(encoded, scale::encode(value));
    return storage_->put(key, common::Buffer{std::move(encoded)});
  }

  outcome::result<std::vector<RouterId>> GatewayStorageImpl::getRouters()
      const {
    OUTCOME_TRY(routers, getDecoded<std::vector<RouterId>>(keys::kRoutersKey));
    return std::move(routers).value_or(std::vector<RouterId>{});
  }

  outcome::result<void> GatewayStorageImpl::putRouters(
      const std::vector<RouterId> &routers) {
    return putEncoded(keys::kRoutersKey, routers);
  }

  outcome::result<SessionId> GatewayStorageImpl::getSessionId() const {
    OUTCOME_TRY(session_id, getDecoded<SessionId>(keys::kSessionIdKey));
    return session_id.value_or(0);
  }

  outcome::result<void> GatewayStorageImpl::putSessionId(SessionId session_id) {
    return putEncoded(keys::kSessionIdKey, session_id);
  }

  outcome::result<std::optional<InboundEntry>>
  GatewayStorageImpl::getInboundEntry(const MessageProof &proof,
                                      const RouterId &router_id) const {
    return getDecoded<InboundEntry>(
        keys::makeKey(keys::kPendingInboundPrefix, proof, router_id));
  }

  outcome::result<void> GatewayStorageImpl::putInboundEntry(
      const MessageProof &proof,
      const RouterId &router_id,
      const InboundEntry &entry) {
    SL_TRACE(logger_,
             "Store pending inbound entry {} of router {}",
             proof,
             router_id);
    return putEncoded(
        keys::makeKey(keys::kPendingInboundPrefix, proof, router_id), entry);
  }

  outcome::result<void> GatewayStorageImpl::removeInboundEntry(
      const MessageProof &proof, const RouterId &router_id) {
    SL_TRACE(logger_,
             "Remove pending inbound entry {} of router {}",
             proof,
             router_id);
    return storage_->remove(
        keys::makeKey(keys::kPendingInboundPrefix, proof, router_id));
  }

  outcome::result<bool> GatewayStorageImpl::hasInstance(
      const primitives::DomainAddress &instance) const {
    return storage_->contains(keys::makeKey(keys::kAllowlistPrefix, instance));
  }

  outcome::result<void> GatewayStorageImpl::putInstance(
      const primitives::DomainAddress &instance) {
    return putEncoded(keys::makeKey(keys::kAllowlistPrefix, instance), true);
  }

  outcome::result<void> GatewayStorageImpl::removeInstance(
      const primitives::DomainAddress &instance) {
    return storage_->remove(keys::makeKey(keys::kAllowlistPrefix, instance));
  }

  outcome::result<std::optional<Message>> GatewayStorageImpl::getPackedMessage(
      const primitives::AccountId &sender,
      const primitives::Domain &destination) const {
    return getDecoded<Message>(
        keys::makeKey(keys::kPackedMessagePrefix, sender, destination));
  }

  outcome::result<void> GatewayStorageImpl::putPackedMessage(
      const primitives::AccountId &sender,
      const primitives::Domain &destination,
      const Message &message) {
    return putEncoded(
        keys::makeKey(keys::kPackedMessagePrefix, sender, destination),
        message);
  }

  outcome::result<void> GatewayStorageImpl::removePackedMessage(
      const primitives::AccountId &sender,
      const primitives::Domain &destination) {
    return storage_->remove(
        keys::makeKey(keys::kPackedMessagePrefix, sender, destination));
  }

}  // namespace lpgate::gateway
