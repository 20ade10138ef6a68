/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>
#include <memory>

#include "application/gateway_configuration.hpp"
#include "application/replay_command.hpp"
#include "gateway/gateway_events.hpp"
#include "log/logger.hpp"

namespace lpgate::storage {
  class TransactionalStorage;
}

namespace lpgate::gateway {
  class GatewayQueue;
  class LiquidityPoolsGateway;
}  // namespace lpgate::gateway

namespace lpgate::application {
  class LoggingInboundHandler;
  class LoggingMessageSender;

  /**
   * Runs a gateway over in-memory storage and feeds it with script commands.
   * The queue is serviced after every command
   */
  class ReplayApplication {
    template <class T>
    using sptr = std::shared_ptr<T>;

   public:
    explicit ReplayApplication(const GatewayConfiguration &config);
    ~ReplayApplication();

    /// Applies routers and instances given on the command line
    outcome::result<void> setup();

    outcome::result<void> execute(const ReplayCommand &command);

    /**
     * Replays the whole script
     * @return process exit code
     */
    int run(std::istream &input);

   private:
    const GatewayConfiguration &config_;

    sptr<gateway::GatewayEventEmitter> gateway_events_;
    sptr<gateway::QueueEventEmitter> queue_events_;
    sptr<storage::TransactionalStorage> storage_;
    sptr<LoggingInboundHandler> handler_;
    sptr<LoggingMessageSender> sender_;
    sptr<gateway::GatewayQueue> queue_;
    sptr<gateway::LiquidityPoolsGateway> gateway_;

    log::Logger logger_;
  };

}  // namespace lpgate::application
