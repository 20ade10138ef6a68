/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"

LPGATE_BLOB_STRICT_TYPEDEF(lpgate::gateway, RouterId, 32);

/// Hash identifying a message among its proofs
LPGATE_BLOB_STRICT_TYPEDEF(lpgate::gateway, MessageProof, 32);

namespace lpgate::gateway {

  /// Incremented on every router change
  using SessionId = uint32_t;

  using MessageNonce = uint64_t;

  /// Abstract execution cost
  using Weight = uint64_t;

}  // namespace lpgate::gateway
