/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <scale/scale.hpp>

#include "outcome/outcome.hpp"

namespace lpgate::primitives {

  enum class ArithmeticError : uint8_t {
    /// Underflow.
    Underflow = 1,
    /// Overflow.
    Overflow,
    /// Division by zero.
    DivisionByZero,
  };

  inline void encode(const ArithmeticError &v, scale::Encoder &encoder) {
    // std::error_code policy preserves 0 index for success cases,
    // so indices on the wire are shifted by one
    encoder.put(static_cast<uint8_t>(v) - 1);
  }

  inline void decode(ArithmeticError &v, scale::Decoder &decoder) {
    v = static_cast<ArithmeticError>(decoder.take() + 1);
  }

}  // namespace lpgate::primitives

OUTCOME_HPP_DECLARE_ERROR(lpgate::primitives, ArithmeticError);
