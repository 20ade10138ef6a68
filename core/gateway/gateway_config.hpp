/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

#include "gateway/message.hpp"
#include "gateway/types.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /// Weight charged per processed message when nothing better is known
  constexpr Weight kDefaultDefensiveWeight = 4'000'000'000;

  constexpr size_t kDefaultMaxIncomingMessageSize = 1024;

  struct GatewayConfig {
    /// Max messages an outbound batch can hold
    size_t max_packed_messages = kMaxBatchMessages;
    /// Longer inbound messages are rejected undecoded
    size_t max_incoming_message_size = kDefaultMaxIncomingMessageSize;
    Weight defensive_weight = kDefaultDefensiveWeight;
    /// Sender of every outbound message
    primitives::DomainAddress sender;
  };

}  // namespace lpgate::gateway
