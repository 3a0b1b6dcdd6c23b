#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace recall::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
