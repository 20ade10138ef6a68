/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/origin.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::primitives, OriginError, e) {
  using E = lpgate::primitives::OriginError;
  switch (e) {
    case E::BadOrigin:
      return "Bad origin";
  }
  return "Unknown OriginError";
}

namespace lpgate::primitives {

  outcome::result<AccountId> ensureSigned(const Origin &origin) {
    if (auto signed_origin = std::get_if<SignedOrigin>(&origin)) {
      return signed_origin->account;
    }
    return OriginError::BadOrigin;
  }

  outcome::result<void> ensureRoot(const Origin &origin) {
    if (std::holds_alternative<RootOrigin>(origin)) {
      return outcome::success();
    }
    return OriginError::BadOrigin;
  }

}  // namespace lpgate::primitives
