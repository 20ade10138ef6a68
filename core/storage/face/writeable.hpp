/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lpgate::storage::face {

  /**
   * @brief An mixin for modifiable map.
   * @tparam K key type
   * @tparam V value type
   * @tparam KView type the key is passed as
   */
  template <typename K, typename V, typename KView = K>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Store value by key
     * @param key key
     * @param value value
     * @return result containing void if put successful, error otherwise
     */
    virtual outcome::result<void> put(const KView &key, V &&value) = 0;

    /**
     * @brief Remove value by key
     * @param key K
     * @return error code if error happened
     */
    virtual outcome::result<void> remove(const KView &key) = 0;
  };

}  // namespace lpgate::storage::face
