#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace recall::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared connection, holding SqliteDB's
  transaction lock until Commit() or Rollback().

  Taking the write lock up front means a completion's read and CAS run
  against the same committed state; the CAS can then only fail for a
  record deleted or updated by an earlier transaction.

  Never open a second SqliteTransaction on a thread that already holds
  one: it blocks on the lock forever.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void Release();

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
};

} // namespace recall::db::sqlite
