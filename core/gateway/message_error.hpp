/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lpgate::gateway {

  enum class MessageError : uint8_t {
    BatchLimitReached = 1,
    NestedBatch,
    DecodingFailed,
  };

}  // namespace lpgate::gateway

OUTCOME_HPP_DECLARE_ERROR(lpgate::gateway, MessageError);
