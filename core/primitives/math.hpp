/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <type_traits>

#include "outcome/outcome.hpp"
#include "primitives/arithmetic_error.hpp"

namespace lpgate::math {

  template <typename T>
  constexpr T sat_mul_unsigned(T x, T y) {
    static_assert(std::numeric_limits<T>::is_integer
                      && !std::numeric_limits<T>::is_signed,
                  "Value must be integer and unsigned!");
    if (x != 0 and y > std::numeric_limits<T>::max() / x) {
      return std::numeric_limits<T>::max();
    }
    return x * y;
  }

  template <typename T>
  constexpr T sat_add_unsigned(T x, T y) {
    static_assert(std::numeric_limits<T>::is_integer
                      && !std::numeric_limits<T>::is_signed,
                  "Value must be integer and unsigned!");
    auto res = x + y;
    res |= -(res < x);
    return res;
  }

  /// x += y, fails with ArithmeticError::Overflow leaving x untouched
  template <typename T>
  inline outcome::result<void> checked_add(T &x, T y) {
    static_assert(std::numeric_limits<T>::is_integer
                      && !std::numeric_limits<T>::is_signed,
                  "Value must be integer and unsigned!");
    if (x > std::numeric_limits<T>::max() - y) {
      return primitives::ArithmeticError::Overflow;
    }
    x += y;
    return outcome::success();
  }

  /// x -= y, fails with ArithmeticError::Underflow leaving x untouched
  template <typename T>
  inline outcome::result<void> checked_sub(T &x, T y) {
    static_assert(std::numeric_limits<T>::is_integer
                      && !std::numeric_limits<T>::is_signed,
                  "Value must be integer and unsigned!");
    if (x >= y) {
      x -= y;
      return outcome::success();
    }
    return primitives::ArithmeticError::Underflow;
  }

}  // namespace lpgate::math
