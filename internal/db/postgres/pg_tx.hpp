#pragma once

#include <memory>

#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace recall::db::postgres {

// Holds one pooled connection for its whole lifetime; the connection goes
// back to the pool after the pqxx::work is gone.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kAborted };

  std::shared_ptr<pqxx::connection> conn_; // declared first: outlives work_
  std::unique_ptr<pqxx::work>       work_;
  State                             state_ = State::kOpen;
};

} // namespace recall::db::postgres
