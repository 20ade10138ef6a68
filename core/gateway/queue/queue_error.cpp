/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/queue/queue_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::gateway, QueueError, e) {
  using E = lpgate::gateway::QueueError;
  switch (e) {
    case E::MessageNotFound:
      return "Message not found in the queue";
    case E::ProcessorNotSet:
      return "Queue has no message processor";
  }
  return "Unknown QueueError";
}
