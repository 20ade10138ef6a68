/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>

#include "storage/buffer_map_types.hpp"

namespace lpgate::storage {

  /**
   * Storage layer that keeps its changes in memory on top of a parent
   * storage. Reads fall through to the parent unless the key was written or
   * removed in this layer. Changes reach the parent only on writeBack()
   */
  class TopperStorage : public BufferStorage {
   public:
    explicit TopperStorage(std::shared_ptr<BufferStorage> parent);

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer &&value) override;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<void> remove(const BufferView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    /// Applies the accumulated changes to the parent and forgets them
    outcome::result<void> writeBack();

   private:
    std::shared_ptr<BufferStorage> parent_;
    std::map<Buffer, std::optional<Buffer>> cache_;
  };

}  // namespace lpgate::storage
