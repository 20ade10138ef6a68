/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include <boost/algorithm/hex.hpp>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace lpgate::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace lpgate::common

OUTCOME_HPP_DECLARE_ERROR(lpgate::common, UnhexError);

namespace lpgate::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower_0x(BufferView bytes);

  template <std::output_iterator<uint8_t> Iter>
  outcome::result<void> unhex_to(std::string_view hex, Iter out) {
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), out);
      return outcome::success();

    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &e) {
      return UnhexError::UNKNOWN;
    }
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<Buffer> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<Buffer> unhexWith0x(std::string_view hex);

}  // namespace lpgate::common
