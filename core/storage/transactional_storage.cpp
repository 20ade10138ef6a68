/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/transactional_storage.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::storage, TransactionalStorage::Error, e) {
  using E = lpgate::storage::TransactionalStorage::Error;
  switch (e) {
    case E::NO_TRANSACTIONS_WERE_STARTED:
      return "No storage transactions were started";
  }
  return "Unknown TransactionalStorage error";
}

namespace lpgate::storage {

  TransactionalStorage::TransactionalStorage(
      std::shared_ptr<BufferStorage> base)
      : base_{std::move(base)},
        logger_{log::createLogger("TransactionalStorage", "storage")} {}

  BufferStorage &TransactionalStorage::current() const {
    if (transaction_stack_.empty()) {
      return *base_;
    }
    return *transaction_stack_.back();
  }

  outcome::result<Buffer> TransactionalStorage::get(
      const BufferView &key) const {
    return current().get(key);
  }

  outcome::result<std::optional<Buffer>> TransactionalStorage::tryGet(
      const BufferView &key) const {
    return current().tryGet(key);
  }

  outcome::result<void> TransactionalStorage::put(const BufferView &key,
                                                  Buffer &&value) {
    return current().put(key, std::move(value));
  }

  outcome::result<bool> TransactionalStorage::contains(
      const BufferView &key) const {
    return current().contains(key);
  }

  outcome::result<void> TransactionalStorage::remove(const BufferView &key) {
    return current().remove(key);
  }

  std::unique_ptr<BufferBatch> TransactionalStorage::batch() {
    return current().batch();
  }

  void TransactionalStorage::startTransaction() {
    std::shared_ptr<BufferStorage> parent = base_;
    if (not transaction_stack_.empty()) {
      parent = transaction_stack_.back();
    }
    transaction_stack_.emplace_back(
        std::make_shared<TopperStorage>(std::move(parent)));
    SL_TRACE(logger_,
             "Start storage transaction, depth {}",
             transaction_stack_.size());
  }

  outcome::result<void> TransactionalStorage::rollbackTransaction() {
    if (transaction_stack_.empty()) {
      return Error::NO_TRANSACTIONS_WERE_STARTED;
    }

    SL_TRACE(logger_,
             "Rollback storage transaction, depth {}",
             transaction_stack_.size());
    transaction_stack_.pop_back();
    return outcome::success();
  }

  outcome::result<void> TransactionalStorage::commitTransaction() {
    if (transaction_stack_.empty()) {
      return Error::NO_TRANSACTIONS_WERE_STARTED;
    }

    OUTCOME_TRY(transaction_stack_.back()->writeBack());

    SL_TRACE(logger_,
             "Commit storage transaction, depth {}",
             transaction_stack_.size());
    transaction_stack_.pop_back();
    return outcome::success();
  }

}  // namespace lpgate::storage
