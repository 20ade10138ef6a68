/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/message_sender.hpp"

#include <gmock/gmock.h>

namespace lpgate::gateway {

  class MessageSenderMock : public MessageSender {
   public:
    MOCK_METHOD(outcome::result<void>,
                send,
                (const RouterId &,
                 const primitives::DomainAddress &,
                 common::BufferView),
                (override));
  };

}  // namespace lpgate::gateway
