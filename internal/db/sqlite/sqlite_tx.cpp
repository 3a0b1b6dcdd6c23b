#include "sqlite_tx.hpp"

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace recall::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->LockForTransaction()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!lock_.owns_lock()) return;

  try {
    Rollback();
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    const std::string reason = e.what();
    const auto        code   = sqlite3_errcode(db_->Handle()) == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError;
    try {
      Rollback();
    } catch (const std::exception& rollback_error) {
      RECALL_LOG_WARN("sqlite rollback after failed commit failed", {observability::StringField("error", rollback_error.what())});
    }
    throw CommitError(code, "sqlite commit failed: " + reason);
  }
  committed_ = true;
  Release();
}

void SqliteTransaction::Rollback() {
  if (!lock_.owns_lock()) return;

  // sqlite may have rolled back by itself after a failed COMMIT
  try {
    if (!sqlite3_get_autocommit(db_->Handle())) db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    Release();
    throw;
  }
  Release();
}

void SqliteTransaction::Release() {
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace recall::db::sqlite
