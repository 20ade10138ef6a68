/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::common, UnhexError, e) {
  using lpgate::common::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
    case UnhexError::MISSING_0X_PREFIX:
      return "Missing expected 0x prefix";
    case UnhexError::UNKNOWN:
      return "Unknown error";
  }
  return "Unknown error (error id not listed)";
}

namespace lpgate::common {

  std::string hex_lower(BufferView bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower_0x(BufferView bytes) {
    return "0x" + hex_lower(bytes);
  }

  outcome::result<Buffer> unhex(std::string_view hex) {
    Buffer blob;
    blob.reserve((hex.size() + 1) / 2);
    OUTCOME_TRY(unhex_to(hex, std::back_inserter(blob)));
    return blob;
  }

  outcome::result<Buffer> unhexWith0x(std::string_view hex_with_prefix) {
    constexpr std::string_view prefix = "0x";
    if (not hex_with_prefix.starts_with(prefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex_with_prefix.substr(prefix.size()));
  }

}  // namespace lpgate::common
