/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/message_sender.hpp"

#include "common/hexutil.hpp"
#include "log/logger.hpp"

namespace lpgate::application {

  /**
   * Prints outbound messages as the routers would receive them
   */
  class LoggingMessageSender : public gateway::MessageSender {
   public:
    LoggingMessageSender()
        : logger_{log::createLogger("MessageSender", "application")} {}

    outcome::result<void> send(const gateway::RouterId &router_id,
                               const primitives::DomainAddress &sender,
                               common::BufferView message) override {
      ++sent_;
      SL_INFO(logger_,
              "Router {} <- {} from {}",
              router_id,
              common::hex_lower_0x(message),
              sender);
      return outcome::success();
    }

    size_t sent() const {
      return sent_;
    }

   private:
    log::Logger logger_;
    size_t sent_ = 0;
  };

}  // namespace lpgate::application
