/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/message_queue.hpp"

#include <map>
#include <memory>
#include <system_error>

#include "gateway/gateway_events.hpp"
#include "gateway/message_processor.hpp"
#include "log/logger.hpp"

namespace lpgate::gateway {

  /**
   * Nonce ordered queue of gateway messages. Messages failed to process are
   * kept apart and may be retried explicitly
   */
  class GatewayQueue : public MessageQueue {
   public:
    struct FailedMessage {
      GatewayMessage message;
      std::error_code error;
    };

    explicit GatewayQueue(std::shared_ptr<QueueEventEmitter> events);

    void setProcessor(std::weak_ptr<MessageProcessor> processor);

    outcome::result<void> submit(GatewayMessage message) override;

    /**
     * Processes the queued message. A processing failure moves the message
     * to the failed ones and is not an error of this call
     * @return MessageNotFound if there is no message with the nonce
     */
    outcome::result<void> processMessage(MessageNonce nonce);

    /**
     * Retries a failed message, which is dropped only if it succeeds
     * @return the processing error, MessageNotFound if there is no failed
     * message with the nonce
     */
    outcome::result<void> processFailedMessage(MessageNonce nonce);

    /**
     * Processes queued messages in nonce order until `max_weight` is
     * consumed
     * @return weight used
     */
    Weight serviceMessageQueue(Weight max_weight);

    MessageNonce lastNonce() const {
      return nonce_;
    }

    const std::map<MessageNonce, GatewayMessage> &messages() const {
      return messages_;
    }

    const std::map<MessageNonce, FailedMessage> &failedMessages() const {
      return failed_messages_;
    }

   private:
    outcome::result<ProcessResult> processWith(const GatewayMessage &message);

    /// Processes and dequeues the message, returns the weight it consumed
    outcome::result<Weight> executeQueued(MessageNonce nonce);

    std::shared_ptr<QueueEventEmitter> events_;
    std::weak_ptr<MessageProcessor> processor_;
    MessageNonce nonce_ = 0;
    std::map<MessageNonce, GatewayMessage> messages_;
    std::map<MessageNonce, FailedMessage> failed_messages_;
    log::Logger logger_;
  };

}  // namespace lpgate::gateway
