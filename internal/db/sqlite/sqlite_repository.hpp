#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace recall::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReviewRecord(Transaction&, const model::ReviewRecord&) override;
  std::optional<model::ReviewRecord> GetReviewRecord(Transaction&, const std::string&) override;
  std::optional<model::ReviewRecord> FindReviewRecordByContent(Transaction&, const std::string& user_id, const std::string& content_id,
                                                              recall::scheduler::v1::ContentType content_type) override;
  std::vector<model::ReviewRecord> ListReviewRecords(Transaction&, const std::string& user_id) override;
  std::vector<model::ReviewRecord> ListDueReviewRecords(Transaction&, const std::string& user_id, uint64_t now_ms) override;
  Result UpdateReviewRecord(Transaction&, const model::ReviewRecord&, uint64_t expected_version) override;
  Result DeleteReviewRecord(Transaction&, const std::string&) override;

  Result AppendReviewEvent(Transaction&, const model::ReviewEventRecord&) override;
  std::vector<model::ReviewEventRecord> ListReviewEvents(Transaction&, const std::string& user_id, uint64_t from_ms, uint64_t to_ms) override;
  std::optional<model::ReviewEventRecord> GetLatestReviewEvent(Transaction&, const std::string& record_id) override;
  uint64_t CountReviewEvents(Transaction&, const std::string& user_id) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  // true on a row, false once the statement is done; throws on any error.
  static bool StepRow(sqlite3* db, sqlite3_stmt* st);

  std::shared_ptr<SqliteDB> db_;
};

}
