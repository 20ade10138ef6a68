/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/origin.hpp"

namespace lpgate::gateway {

  /**
   * Decides which origins may administer the gateway
   */
  class AdminOrigin {
   public:
    virtual ~AdminOrigin() = default;

    /// OriginError::BadOrigin if `origin` is not allowed
    virtual outcome::result<void> ensureOrigin(
        const primitives::Origin &origin) const = 0;
  };

  /// Only root may administer
  class EnsureRoot : public AdminOrigin {
   public:
    outcome::result<void> ensureOrigin(
        const primitives::Origin &origin) const override {
      return primitives::ensureRoot(origin);
    }
  };

}  // namespace lpgate::gateway
