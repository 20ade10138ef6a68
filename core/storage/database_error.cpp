/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::storage, DatabaseError, e) {
  using E = lpgate::storage::DatabaseError;
  switch (e) {
    case E::OK:
      return "success";
    case E::NOT_FOUND:
      return "entry not found in database";
    case E::UNKNOWN:
      break;
  }

  return "unknown error";
}
