/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "storage/buffer_map_types.hpp"

namespace lpgate::storage {

  /**
   * Simple storage that conforms BufferStorage interface.
   * Holds the gateway state of a single process run
   */
  class InMemoryStorage : public storage::BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer &&value) override;

    outcome::result<bool> contains(const BufferView &key) const override;

    bool empty() const;

    outcome::result<void> remove(const BufferView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    /// Number of stored entries
    size_t size() const {
      return storage_.size();
    }

   private:
    std::map<Buffer, Buffer> storage_;
  };

}  // namespace lpgate::storage
