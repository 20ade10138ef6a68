/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lpgate::storage {

  /**
   * @brief universal database interface error
   */
  enum class DatabaseError : int {
    OK = 0,
    NOT_FOUND = 1,

    UNKNOWN = 1000
  };
}  // namespace lpgate::storage

OUTCOME_HPP_DECLARE_ERROR(lpgate::storage, DatabaseError);
