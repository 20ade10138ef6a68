/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/overlay/topper_storage.hpp"

#include "storage/database_error.hpp"

namespace lpgate::storage {

  namespace {
    class TopperBatch : public BufferBatch {
     public:
      explicit TopperBatch(TopperStorage &storage) : storage_{storage} {}

      outcome::result<void> put(const BufferView &key,
                                Buffer &&value) override {
        entries_[Buffer{key.begin(), key.end()}] = std::move(value);
        return outcome::success();
      }

      outcome::result<void> remove(const BufferView &key) override {
        entries_[Buffer{key.begin(), key.end()}] = std::nullopt;
        return outcome::success();
      }

      outcome::result<void> commit() override {
        for (auto &[key, value] : entries_) {
          if (value) {
            OUTCOME_TRY(storage_.put(key, std::move(*value)));
          } else {
            OUTCOME_TRY(storage_.remove(key));
          }
        }
        entries_.clear();
        return outcome::success();
      }

      void clear() override {
        entries_.clear();
      }

     private:
      TopperStorage &storage_;
      std::map<Buffer, std::optional<Buffer>> entries_;
    };
  }  // namespace

  TopperStorage::TopperStorage(std::shared_ptr<BufferStorage> parent)
      : parent_{std::move(parent)} {}

  outcome::result<Buffer> TopperStorage::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (value) {
      return std::move(*value);
    }
    return DatabaseError::NOT_FOUND;
  }

  outcome::result<std::optional<Buffer>> TopperStorage::tryGet(
      const BufferView &key) const {
    auto it = cache_.find(Buffer{key.begin(), key.end()});
    if (it != cache_.end()) {
      return it->second;
    }
    return parent_->tryGet(key);
  }

  outcome::result<void> TopperStorage::put(const BufferView &key,
                                           Buffer &&value) {
    cache_[Buffer{key.begin(), key.end()}] = std::move(value);
    return outcome::success();
  }

  outcome::result<bool> TopperStorage::contains(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<void> TopperStorage::remove(const BufferView &key) {
    cache_[Buffer{key.begin(), key.end()}] = std::nullopt;
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> TopperStorage::batch() {
    return std::make_unique<TopperBatch>(*this);
  }

  outcome::result<void> TopperStorage::writeBack() {
    auto batch = parent_->batch();
    for (auto &[key, value] : cache_) {
      if (value) {
        OUTCOME_TRY(batch->put(key, std::move(*value)));
      } else {
        OUTCOME_TRY(batch->remove(key));
      }
    }
    OUTCOME_TRY(batch->commit());
    cache_.clear();
    return outcome::success();
  }

}  // namespace lpgate::storage
