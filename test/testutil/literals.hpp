/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include "gateway/types.hpp"
#include "primitives/domain_address.hpp"

// Identifiers filled with the bytes of the literal, zero padded

inline lpgate::gateway::RouterId operator""_router(const char *c, size_t s) {
  lpgate::gateway::RouterId id;
  std::copy_n(c, std::min(s, id.size()), id.begin());
  return id;
}

inline lpgate::primitives::AccountId operator""_account(const char *c,
                                                        size_t s) {
  lpgate::primitives::AccountId id;
  std::copy_n(c, std::min(s, id.size()), id.begin());
  return id;
}

inline lpgate::primitives::EvmAddress operator""_evm(const char *c, size_t s) {
  lpgate::primitives::EvmAddress address;
  std::copy_n(c, std::min(s, address.size()), address.begin());
  return address;
}
