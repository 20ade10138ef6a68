/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lpgate::gateway {

  enum class GatewayError : uint8_t {
    NotEnoughRoutersForDomain = 1,
    UnknownRouter,
    DomainNotSupported,
    InstanceAlreadyAdded,
    UnknownInstance,
    InvalidMessageOrigin,
    MessageDecodingFailed,
    MessageExpectedFromFirstRouter,
    ProofNotExpectedFromFirstRouter,
    ExpectedMessageType,
    ExpectedMessageProofType,
    PendingInboundEntryNotFound,
    MessagePackingAlreadyStarted,
    MessagePackingNotStarted,
    DuplicateRouter,
  };

}  // namespace lpgate::gateway

OUTCOME_HPP_DECLARE_ERROR(lpgate::gateway, GatewayError);
