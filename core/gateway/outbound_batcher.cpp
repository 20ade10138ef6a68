/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/outbound_batcher.hpp"

#include <boost/assert.hpp>

#include "gateway/gateway_error.hpp"

namespace lpgate::gateway {

  OutboundBatcher::OutboundBatcher(std::shared_ptr<GatewayStorage> storage,
                                   size_t max_packed_messages)
      : storage_{std::move(storage)},
        max_packed_messages_{max_packed_messages},
        logger_{log::createLogger("OutboundBatcher", "batching")} {
    BOOST_ASSERT(storage_ != nullptr);
  }

  outcome::result<void> OutboundBatcher::startBatch(
      const primitives::AccountId &sender,
      const primitives::Domain &destination) {
    OUTCOME_TRY(packed, storage_->getPackedMessage(sender, destination));
    if (packed.has_value()) {
      return GatewayError::MessagePackingAlreadyStarted;
    }
    SL_DEBUG(logger_, "Start packing messages of {} to {}", sender, destination);
    return storage_->putPackedMessage(sender, destination, Message::empty());
  }

  outcome::result<bool> OutboundBatcher::packIfStarted(
      const primitives::AccountId &sender,
      const primitives::Domain &destination,
      const Message &message) {
    OUTCOME_TRY(packed, storage_->getPackedMessage(sender, destination));
    if (not packed.has_value()) {
      return false;
    }
    Message batch = std::move(packed.value());
    if (auto res = batch.packWith(message, max_packed_messages_);
        res.has_error()) {
      SL_DEBUG(logger_,
               "Can not pack message of {} to {}: {}",
               sender,
               destination,
               res.error().message());
      return res.as_failure();
    }
    OUTCOME_TRY(storage_->putPackedMessage(sender, destination, batch));
    return true;
  }

  outcome::result<std::optional<Message>> OutboundBatcher::endBatch(
      const primitives::AccountId &sender,
      const primitives::Domain &destination) {
    OUTCOME_TRY(packed, storage_->getPackedMessage(sender, destination));
    if (not packed.has_value()) {
      return GatewayError::MessagePackingNotStarted;
    }
    OUTCOME_TRY(storage_->removePackedMessage(sender, destination));

    if (packed->submessages().empty()) {
      SL_DEBUG(logger_, "Nothing packed by {} to {}", sender, destination);
      return std::nullopt;
    }
    SL_DEBUG(logger_,
             "Packed {} messages of {} to {}",
             packed->submessages().size(),
             sender,
             destination);
    return std::move(packed);
  }

}  // namespace lpgate::gateway
