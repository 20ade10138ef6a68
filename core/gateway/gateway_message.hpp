/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "gateway/message.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /// Message received from a remote domain through a router
  struct InboundGatewayMessage {
    primitives::DomainAddress domain_address;
    Message message;
    RouterId router_id;

    bool operator==(const InboundGatewayMessage &) const = default;
  };

  /// Message to be sent to a remote domain through a router
  struct OutboundGatewayMessage {
    primitives::DomainAddress sender;
    Message message;
    RouterId router_id;

    bool operator==(const OutboundGatewayMessage &) const = default;
  };

  using GatewayMessage =
      std::variant<InboundGatewayMessage, OutboundGatewayMessage>;

}  // namespace lpgate::gateway
