/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/message_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::gateway, MessageError, e) {
  using E = lpgate::gateway::MessageError;
  switch (e) {
    case E::BatchLimitReached:
      return "Batch limit reached";
    case E::NestedBatch:
      return "Batch messages can not be nested";
    case E::DecodingFailed:
      return "Message deserialization failed";
  }
  return "Unknown MessageError";
}
