/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/queue/gateway_queue.hpp"

#include <boost/assert.hpp>

#include "gateway/queue/queue_error.hpp"
#include "primitives/math.hpp"

namespace lpgate::gateway {

  GatewayQueue::GatewayQueue(std::shared_ptr<QueueEventEmitter> events)
      : events_{std::move(events)},
        logger_{log::createLogger("GatewayQueue", "queue")} {
    BOOST_ASSERT(events_ != nullptr);
  }

  void GatewayQueue::setProcessor(std::weak_ptr<MessageProcessor> processor) {
    processor_ = std::move(processor);
  }

  outcome::result<void> GatewayQueue::submit(GatewayMessage message) {
    MessageNonce nonce = nonce_;
    OUTCOME_TRY(math::checked_add(nonce, MessageNonce{1}));
    nonce_ = nonce;
    messages_.emplace(nonce, std::move(message));
    SL_TRACE(logger_, "Message #{} submitted", nonce);
    events_->fire(MessageSubmitted{nonce});
    return outcome::success();
  }

  outcome::result<ProcessResult> GatewayQueue::processWith(
      const GatewayMessage &message) {
    auto processor = processor_.lock();
    if (processor == nullptr) {
      return QueueError::ProcessorNotSet;
    }
    return processor->process(message);
  }

  outcome::result<Weight> GatewayQueue::executeQueued(MessageNonce nonce) {
    auto it = messages_.find(nonce);
    if (it == messages_.end()) {
      return QueueError::MessageNotFound;
    }

    OUTCOME_TRY(processed, processWith(it->second));
    GatewayMessage message = std::move(it->second);
    messages_.erase(it);

    if (processed.result.has_error()) {
      auto error = processed.result.error();
      SL_WARN(logger_, "Message #{} failed: {}", nonce, error.message());
      failed_messages_.emplace(nonce, FailedMessage{std::move(message), error});
      events_->fire(MessageExecutionFailure{nonce, error});
    } else {
      SL_TRACE(logger_, "Message #{} processed", nonce);
      events_->fire(MessageExecutionSuccess{nonce});
    }
    return processed.weight;
  }

  outcome::result<void> GatewayQueue::processMessage(MessageNonce nonce) {
    OUTCOME_TRY(executeQueued(nonce));
    return outcome::success();
  }

  outcome::result<void> GatewayQueue::processFailedMessage(MessageNonce nonce) {
    auto it = failed_messages_.find(nonce);
    if (it == failed_messages_.end()) {
      return QueueError::MessageNotFound;
    }

    OUTCOME_TRY(processed, processWith(it->second.message));
    if (processed.result.has_error()) {
      it->second.error = processed.result.error();
      SL_DEBUG(logger_,
               "Failed message #{} failed again: {}",
               nonce,
               it->second.error.message());
      return processed.result.as_failure();
    }

    failed_messages_.erase(it);
    events_->fire(MessageExecutionSuccess{nonce});
    return outcome::success();
  }

  Weight GatewayQueue::serviceMessageQueue(Weight max_weight) {
    Weight weight_used = 0;
    while (not messages_.empty()) {
      auto &[nonce, message] = *messages_.begin();
      auto processor = processor_.lock();
      if (processor == nullptr) {
        SL_ERROR(logger_,
                 "Can not service message #{}: {}",
                 nonce,
                 make_error_code(QueueError::ProcessorNotSet).message());
        break;
      }

      auto remaining_weight =
          weight_used < max_weight ? max_weight - weight_used : Weight{0};
      if (remaining_weight < processor->maxProcessingWeight(message)) {
        break;
      }

      const MessageNonce next = nonce;
      auto weight = executeQueued(next);
      if (weight.has_error()) {
        SL_ERROR(logger_,
                 "Can not service message #{}: {}",
                 next,
                 weight.error().message());
        break;
      }
      weight_used = math::sat_add_unsigned(weight_used, weight.value());
    }
    return weight_used;
  }

}  // namespace lpgate::gateway
