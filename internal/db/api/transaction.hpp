#pragma once

namespace recall::db {

/*
  Unit of work over the review store.

  A review completion reads the record, CAS-updates it and appends its
  review event inside one Transaction; either all three land or none.

  Every backend guarantees:
  - writes are invisible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards all writes
  - Commit() throws db::CommitError when the backend refuses; a
    concurrent writer winning surfaces as ErrorCode::Conflict

  Isolation per backend:
    Memory   - private snapshot, record versions re-checked at Commit()
    SQLite   - BEGIN IMMEDIATE, one writer per process
    Postgres - pqxx::work at READ COMMITTED, CAS via version predicate
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace recall::db
