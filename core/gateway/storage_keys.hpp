/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "gateway/types.hpp"
#include "primitives/domain_address.hpp"

/**
 * Storage schema overview
 *
 * Every gateway value lives under its own key in one byte-oriented storage,
 * SCALE encoded. Keys are a textual prefix followed by the SCALE encoding of
 * the key components:
 *
 *   :lpgate:routers                        -> std::vector<RouterId>
 *   :lpgate:session_id                     -> SessionId
 *   :lpgate:pending_inbound ++ proof ++ router_id -> InboundEntry
 *   :lpgate:allowlist ++ domain_address    -> bool
 *   :lpgate:packed_message ++ sender ++ domain -> Message
 */

namespace lpgate::gateway::keys {

  inline common::Buffer fromString(std::string_view str) {
    return {str.begin(), str.end()};
  }

  inline const common::Buffer kRoutersKey = fromString(":lpgate:routers");

  inline const common::Buffer kSessionIdKey = fromString(":lpgate:session_id");

  inline const common::Buffer kPendingInboundPrefix =
      fromString(":lpgate:pending_inbound");

  inline const common::Buffer kAllowlistPrefix = fromString(":lpgate:allowlist");

  inline const common::Buffer kPackedMessagePrefix =
      fromString(":lpgate:packed_message");

  /// Prefix followed by the encoded components
  template <typename... Components>
  common::Buffer makeKey(const common::Buffer &prefix,
                         const Components &...components) {
    common::Buffer key = prefix;
    (
        [&] {
          auto encoded = scale::encode(components).value();
          key.insert(key.end(), encoded.begin(), encoded.end());
        }(),
        ...);
    return key;
  }

}  // namespace lpgate::gateway::keys
