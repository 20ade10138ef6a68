/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/overlay/topper_storage.hpp"

namespace lpgate::storage {

  /**
   * Storage with nested transactions. Reads and writes are served by the
   * innermost started transaction, or by the base storage when no
   * transaction is active
   */
  class TransactionalStorage : public BufferStorage {
   public:
    enum class Error : uint8_t {
      NO_TRANSACTIONS_WERE_STARTED = 1,
    };

    explicit TransactionalStorage(std::shared_ptr<BufferStorage> base);

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer &&value) override;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<void> remove(const BufferView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    // ------ Transaction methods ------

    /// Start nested transaction
    void startTransaction();

    /// Rollback and finish last started transaction
    outcome::result<void> rollbackTransaction();

    /// Commit and finish last started transaction
    outcome::result<void> commitTransaction();

    size_t transactionDepth() const {
      return transaction_stack_.size();
    }

   private:
    BufferStorage &current() const;

    std::shared_ptr<BufferStorage> base_;
    std::vector<std::shared_ptr<TopperStorage>> transaction_stack_;
    log::Logger logger_;
  };

  /**
   * Runs `f` inside a new transaction of `storage`. The transaction is
   * committed if `f` succeeds and rolled back otherwise
   */
  template <typename F>
  auto withTransaction(TransactionalStorage &storage, F &&f)
      -> decltype(f()) {
    storage.startTransaction();
    auto res = f();
    if (res.has_error()) {
      OUTCOME_TRY(storage.rollbackTransaction());
      return res;
    }
    OUTCOME_TRY(storage.commitTransaction());
    return res;
  }

}  // namespace lpgate::storage

OUTCOME_HPP_DECLARE_ERROR(lpgate::storage, TransactionalStorage::Error);
