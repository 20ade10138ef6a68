/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/gateway_message.hpp"
#include "outcome/outcome.hpp"

namespace lpgate::gateway {

  /**
   * Queue gateway messages are submitted to for deferred processing
   */
  class MessageQueue {
   public:
    virtual ~MessageQueue() = default;

    virtual outcome::result<void> submit(GatewayMessage message) = 0;
  };

}  // namespace lpgate::gateway
