/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/face/readable.hpp"
#include "storage/face/write_batch.hpp"
#include "storage/face/writeable.hpp"

namespace lpgate::storage::face {

  /**
   * @brief An abstraction over a readable, writeable key-value map which can
   * also collect writes into a batch.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V, typename KView = K>
  struct GenericStorage : Readable<K, V, KView>, Writeable<K, V, KView> {
    /**
     * @brief Creates new batch of writes, applied on commit()
     */
    virtual std::unique_ptr<WriteBatch<K, V, KView>> batch() = 0;
  };

}  // namespace lpgate::storage::face
