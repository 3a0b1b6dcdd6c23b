#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/review_event_record.hpp"
#include "internal/db/model/review_record.hpp"

namespace recall::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - UpdateReviewRecord is compare-and-swap on version
  - A record and its review event are written in one transaction

  The DB is the source of truth for:
    review records
    review history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Review records
  // ---------------------------------------------------------------------

  // AlreadyExists when (user_id, content_id, content_type) is taken.
  virtual Result InsertReviewRecord(Transaction&, const model::ReviewRecord&) = 0;

  virtual std::optional<model::ReviewRecord> GetReviewRecord(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ReviewRecord> FindReviewRecordByContent(Transaction&, const std::string& user_id, const std::string& content_id,
                                                                      recall::scheduler::v1::ContentType content_type) = 0;

  virtual std::vector<model::ReviewRecord> ListReviewRecords(Transaction&, const std::string& user_id) = 0;

  // Records with next_review_ms <= now_ms, unordered.
  virtual std::vector<model::ReviewRecord> ListDueReviewRecords(Transaction&, const std::string& user_id, uint64_t now_ms) = 0;

  // Writes the record only if the stored version equals expected_version.
  // NotFound when the row is gone, Conflict when the version moved.
  virtual Result UpdateReviewRecord(Transaction&, const model::ReviewRecord&, uint64_t expected_version) = 0;

  // Removes the record and its review events.
  virtual Result DeleteReviewRecord(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Review events
  // ---------------------------------------------------------------------

  virtual Result AppendReviewEvent(Transaction&, const model::ReviewEventRecord&) = 0;

  // Events of one user with reviewed_at_ms in [from_ms, to_ms), oldest first.
  virtual std::vector<model::ReviewEventRecord> ListReviewEvents(Transaction&, const std::string& user_id, uint64_t from_ms, uint64_t to_ms) = 0;

  virtual std::optional<model::ReviewEventRecord> GetLatestReviewEvent(Transaction&, const std::string& record_id) = 0;

  virtual uint64_t CountReviewEvents(Transaction&, const std::string& user_id) = 0;
};

} // namespace recall::db
