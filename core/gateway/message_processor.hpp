/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/gateway_message.hpp"
#include "gateway/types.hpp"
#include "outcome/outcome.hpp"

namespace lpgate::gateway {

  /// Outcome of processing a message together with the weight it consumed
  struct ProcessResult {
    outcome::result<void> result;
    Weight weight = 0;
  };

  /**
   * Executes gateway messages taken from the queue
   */
  class MessageProcessor {
   public:
    virtual ~MessageProcessor() = default;

    virtual ProcessResult process(const GatewayMessage &message) = 0;

    /**
     * Upper bound of the weight `process` may consume for the message
     */
    virtual Weight maxProcessingWeight(const GatewayMessage &message) const = 0;
  };

}  // namespace lpgate::gateway
