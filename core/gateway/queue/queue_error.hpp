/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lpgate::gateway {

  enum class QueueError : uint8_t {
    MessageNotFound = 1,
    ProcessorNotSet,
  };

}  // namespace lpgate::gateway

OUTCOME_HPP_DECLARE_ERROR(lpgate::gateway, QueueError);
