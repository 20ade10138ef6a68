/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "gateway/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /**
   * Transport which delivers serialized messages through a router
   */
  class MessageSender {
   public:
    virtual ~MessageSender() = default;

    virtual outcome::result<void> send(const RouterId &router_id,
                                       const primitives::DomainAddress &sender,
                                       common::BufferView message) = 0;
  };

}  // namespace lpgate::gateway
