/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/message.hpp"
#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /**
   * Consumer of inbound messages which reached quorum
   */
  class InboundMessageHandler {
   public:
    virtual ~InboundMessageHandler() = default;

    /**
     * Executes the message
     * @param sender remote address the message came from
     * @param message sub-message to execute, never a batch
     */
    virtual outcome::result<void> handle(
        const primitives::DomainAddress &sender, const Message &message) = 0;
  };

}  // namespace lpgate::gateway
