/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::primitives {

  /// Privileged caller, e.g. governance
  struct RootOrigin {
    bool operator==(const RootOrigin &) const = default;
  };

  /// Caller acting on behalf of a local account
  struct SignedOrigin {
    AccountId account;

    bool operator==(const SignedOrigin &) const = default;
  };

  using Origin = std::variant<RootOrigin, SignedOrigin>;

  enum class OriginError : uint8_t {
    BadOrigin = 1,
  };

  /// Account of a signed origin, BadOrigin otherwise
  outcome::result<AccountId> ensureSigned(const Origin &origin);

  outcome::result<void> ensureRoot(const Origin &origin);

}  // namespace lpgate::primitives

OUTCOME_HPP_DECLARE_ERROR(lpgate::primitives, OriginError);
