#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace recall::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (state_ != State::kOpen) return;

  try {
    work_->abort();
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  // a failed commit leaves nothing to roll back
  state_ = State::kAborted;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw CommitError(ErrorCode::Conflict, e.what());
  } catch (const pqxx::unique_violation& e) {
    throw CommitError(ErrorCode::AlreadyExists, e.what());
  } catch (const pqxx::foreign_key_violation& e) {
    throw CommitError(ErrorCode::NotFound, e.what());
  } catch (const pqxx::broken_connection& e) {
    throw CommitError(ErrorCode::IOError, e.what());
  } catch (const pqxx::sql_error& e) {
    throw CommitError(ErrorCode::InternalError, e.what());
  }
  state_ = State::kCommitted;
}

void PgTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kAborted;
  work_->abort();
}

} // namespace recall::db::postgres
