/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "gateway/types.hpp"
#include "primitives/math.hpp"

namespace lpgate::gateway {

  /**
   * Weight charged for processing `count` sub-messages, each of them is
   * charged with `defensive_weight`
   */
  inline Weight processingWeight(Weight defensive_weight, size_t count) {
    return math::sat_mul_unsigned<Weight>(defensive_weight, count);
  }

}  // namespace lpgate::gateway
