#include "pg_repository.hpp"

namespace recall::db::postgres {

namespace {

// signed columns carry the unsigned model values; epoch ms fits in int64
int64_t ToDb(uint64_t v) {
  return static_cast<int64_t>(v);
}

model::ReviewRecord ReadReviewRecord(const pqxx::row& row) {
  model::ReviewRecord r;
  r.id               = row[0].c_str();
  r.user_id          = row[1].c_str();
  r.content_id       = row[2].c_str();
  r.content_type     = static_cast<recall::scheduler::v1::ContentType>(row[3].as<int>());
  r.review_count     = row[4].as<uint32_t>();
  r.ease_factor      = row[5].as<double>();
  r.interval_days    = row[6].as<uint32_t>();
  r.last_reviewed_ms = row[7].as<uint64_t>();
  r.next_review_ms   = row[8].as<uint64_t>();
  r.created_at_ms    = row[9].as<uint64_t>();
  r.updated_at_ms    = row[10].as<uint64_t>();
  r.version          = row[11].as<uint64_t>();
  return r;
}

model::ReviewEventRecord ReadReviewEvent(const pqxx::row& row) {
  model::ReviewEventRecord e;
  e.id             = row[0].c_str();
  e.record_id      = row[1].c_str();
  e.user_id        = row[2].c_str();
  e.quality        = row[3].as<int32_t>();
  e.reviewed_at_ms = row[4].as<uint64_t>();
  e.interval_days  = row[5].as<uint32_t>();
  e.ease_factor    = row[6].as<double>();
  e.first_review   = row[7].as<bool>();
  return e;
}

std::vector<model::ReviewRecord> ReadReviewRecords(const pqxx::result& res) {
  std::vector<model::ReviewRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadReviewRecord(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertReviewRecord(Transaction& t, const model::ReviewRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_review_record", r.id, r.user_id, r.content_id, static_cast<int>(r.content_type),
                               static_cast<int64_t>(r.review_count), r.ease_factor, static_cast<int64_t>(r.interval_days),
                               ToDb(r.last_reviewed_ms), ToDb(r.next_review_ms), ToDb(r.created_at_ms), ToDb(r.updated_at_ms),
                               ToDb(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReviewRecord> PgRepository::GetReviewRecord(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_review_record", id);
  if (res.empty()) return std::nullopt;
  return ReadReviewRecord(res[0]);
}

std::optional<model::ReviewRecord> PgRepository::FindReviewRecordByContent(Transaction& t, const std::string& user_id, const std::string& content_id,
                                                                          recall::scheduler::v1::ContentType content_type) {
  auto res = TX(t).Work().exec_prepared("find_review_record_by_content", user_id, content_id, static_cast<int>(content_type));
  if (res.empty()) return std::nullopt;
  return ReadReviewRecord(res[0]);
}

std::vector<model::ReviewRecord> PgRepository::ListReviewRecords(Transaction& t, const std::string& user_id) {
  return ReadReviewRecords(TX(t).Work().exec_prepared("list_review_records", user_id));
}

std::vector<model::ReviewRecord> PgRepository::ListDueReviewRecords(Transaction& t, const std::string& user_id, uint64_t now_ms) {
  return ReadReviewRecords(TX(t).Work().exec_prepared("list_due_review_records", user_id, ToDb(now_ms)));
}

Result PgRepository::UpdateReviewRecord(Transaction& t, const model::ReviewRecord& r, uint64_t expected_version) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_review_record", r.id, static_cast<int64_t>(r.review_count), r.ease_factor,
                                    static_cast<int64_t>(r.interval_days), ToDb(r.last_reviewed_ms), ToDb(r.next_review_ms),
                                    ToDb(r.updated_at_ms), ToDb(r.version), ToDb(expected_version));
    if (res.affected_rows() > 0) return Result::Ok();

    if (work.exec_prepared("review_record_exists", r.id).empty()) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "version changed, expected " + std::to_string(expected_version));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReviewRecord(Transaction& t, const std::string& id) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("delete_review_events_for_record", id);
    auto res = work.exec_prepared("delete_review_record", id);
    return res.affected_rows() > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendReviewEvent(Transaction& t, const model::ReviewEventRecord& e) {
  try {
    TX(t).Work().exec_prepared("insert_review_event", e.id, e.record_id, e.user_id, e.quality, ToDb(e.reviewed_at_ms),
                               static_cast<int64_t>(e.interval_days), e.ease_factor, e.first_review);
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

std::vector<model::ReviewEventRecord> PgRepository::ListReviewEvents(Transaction& t, const std::string& user_id, uint64_t from_ms, uint64_t to_ms) {
  auto res = TX(t).Work().exec_prepared("list_review_events", user_id, ToDb(from_ms), ToDb(to_ms));

  std::vector<model::ReviewEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadReviewEvent(row));
  }
  return out;
}

std::optional<model::ReviewEventRecord> PgRepository::GetLatestReviewEvent(Transaction& t, const std::string& record_id) {
  auto res = TX(t).Work().exec_prepared("latest_review_event", record_id);
  if (res.empty()) return std::nullopt;
  return ReadReviewEvent(res[0]);
}

uint64_t PgRepository::CountReviewEvents(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_prepared("count_review_events", user_id);
  if (res.empty()) return 0;
  return res[0][0].as<uint64_t>();
}

}
