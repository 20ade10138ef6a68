/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include "common/buffer.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace lpgate::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<void> put(const BufferView &key, Buffer &&value) override {
      entries[Buffer{key.begin(), key.end()}] = std::move(value);
      return outcome::success();
    }

    outcome::result<void> remove(const BufferView &key) override {
      entries[Buffer{key.begin(), key.end()}] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[key, value] : entries) {
        if (value) {
          OUTCOME_TRY(db.put(key, std::move(*value)));
        } else {
          OUTCOME_TRY(db.remove(key));
        }
      }
      entries.clear();
      return outcome::success();
    }

    void clear() override {
      entries.clear();
    }

   private:
    std::map<Buffer, std::optional<Buffer>> entries;
    InMemoryStorage &db;
  };

}  // namespace lpgate::storage
