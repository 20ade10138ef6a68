/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "gateway/gateway_storage.hpp"
#include "gateway/message.hpp"
#include "log/logger.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /**
   * Packs outbound messages of one sender to one destination into a single
   * batch between startBatch() and endBatch()
   */
  class OutboundBatcher {
   public:
    OutboundBatcher(std::shared_ptr<GatewayStorage> storage,
                    size_t max_packed_messages);

    /// MessagePackingAlreadyStarted if a batch is open already
    outcome::result<void> startBatch(const primitives::AccountId &sender,
                                     const primitives::Domain &destination);

    /**
     * Adds the message to the open batch
     * @return false if no batch is open, BatchLimitReached if it is full
     */
    outcome::result<bool> packIfStarted(const primitives::AccountId &sender,
                                        const primitives::Domain &destination,
                                        const Message &message);

    /**
     * Closes the batch
     * @return packed message, or std::nullopt if nothing was packed
     */
    outcome::result<std::optional<Message>> endBatch(
        const primitives::AccountId &sender,
        const primitives::Domain &destination);

   private:
    std::shared_ptr<GatewayStorage> storage_;
    const size_t max_packed_messages_;
    log::Logger logger_;
  };

}  // namespace lpgate::gateway
