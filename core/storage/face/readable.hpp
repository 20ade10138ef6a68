/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"

namespace lpgate::storage::face {

  /**
   * @brief A mixin for read-only map.
   * @tparam K key type
   * @tparam V value type
   * @tparam KView type the key is looked up by
   */
  template <typename K, typename V, typename KView = K>
  struct Readable {
    virtual ~Readable() = default;

    /**
     * @brief Checks if given key-value binding exists in the storage.
     * @param key K
     * @return true if key has value, false if does not, or error at .
     */
    virtual outcome::result<bool> contains(const KView &key) const = 0;

    /**
     * @brief Get value by key
     * @param key K
     * @return V or NOT_FOUND
     */
    virtual outcome::result<V> get(const KView &key) const = 0;

    /**
     * @brief Get value by key
     * @param key K
     * @return V if contains(K) or std::nullopt
     */
    virtual outcome::result<std::optional<V>> tryGet(
        const KView &key) const = 0;
  };

}  // namespace lpgate::storage::face
