/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_batch.hpp"

namespace lpgate::storage {

  outcome::result<Buffer> InMemoryStorage::get(const BufferView &key) const {
    auto it = storage_.find(Buffer{key.begin(), key.end()});
    if (it != storage_.end()) {
      return it->second;
    }

    return DatabaseError::NOT_FOUND;
  }

  outcome::result<std::optional<Buffer>> InMemoryStorage::tryGet(
      const BufferView &key) const {
    auto it = storage_.find(Buffer{key.begin(), key.end()});
    if (it != storage_.end()) {
      return it->second;
    }

    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const BufferView &key,
                                             Buffer &&value) {
    storage_[Buffer{key.begin(), key.end()}] = std::move(value);
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const BufferView &key) const {
    return storage_.find(Buffer{key.begin(), key.end()}) != storage_.end();
  }

  bool InMemoryStorage::empty() const {
    return storage_.empty();
  }

  outcome::result<void> InMemoryStorage::remove(const BufferView &key) {
    storage_.erase(Buffer{key.begin(), key.end()});
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

}  // namespace lpgate::storage
