/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/inbound_message_handler.hpp"

#include "log/logger.hpp"

namespace lpgate::application {

  /**
   * Reports executed inbound messages instead of executing them
   */
  class LoggingInboundHandler : public gateway::InboundMessageHandler {
   public:
    LoggingInboundHandler()
        : logger_{log::createLogger("InboundHandler", "application")} {}

    outcome::result<void> handle(const primitives::DomainAddress &sender,
                                 const gateway::Message &message) override {
      ++handled_;
      SL_INFO(logger_,
              "Executed {} from {} ({})",
              message,
              sender,
              message.hash());
      return outcome::success();
    }

    size_t handled() const {
      return handled_;
    }

   private:
    log::Logger logger_;
    size_t handled_ = 0;
  };

}  // namespace lpgate::application
