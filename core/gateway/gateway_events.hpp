/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>
#include <variant>
#include <vector>

#include "common/event_emitter.hpp"
#include "gateway/types.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  struct RoutersSet {
    std::vector<RouterId> router_ids;
    SessionId session_id = 0;
  };

  struct InstanceAdded {
    primitives::DomainAddress instance;
  };

  struct InstanceRemoved {
    primitives::DomainAddress instance;
  };

  struct MessageRecoveryExecuted {
    MessageProof proof;
    RouterId router_id;
  };

  using GatewayEvent = std::variant<RoutersSet,
                                    InstanceAdded,
                                    InstanceRemoved,
                                    MessageRecoveryExecuted>;

  using GatewayEventEmitter = common::EventEmitter<GatewayEvent>;

  struct MessageSubmitted {
    MessageNonce nonce = 0;
  };

  struct MessageExecutionSuccess {
    MessageNonce nonce = 0;
  };

  struct MessageExecutionFailure {
    MessageNonce nonce = 0;
    std::error_code error;
  };

  using QueueEvent = std::variant<MessageSubmitted,
                                  MessageExecutionSuccess,
                                  MessageExecutionFailure>;

  using QueueEventEmitter = common::EventEmitter<QueueEvent>;

}  // namespace lpgate::gateway
