/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace lpgate::common {

  /// Owned byte sequence
  using Buffer = std::vector<uint8_t>;

  /// Non-owning view over bytes
  using BufferView = std::span<const uint8_t>;

}  // namespace lpgate::common
