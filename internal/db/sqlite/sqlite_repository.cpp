#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace recall::db::sqlite {

using recall::db::ErrorCode;
using recall::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// column order: RECALL_REVIEW_RECORD_COLUMNS
model::ReviewRecord ReadReviewRecord(sqlite3_stmt* st) {
    model::ReviewRecord r;
    r.id               = ColText(st, 0);
    r.user_id          = ColText(st, 1);
    r.content_id       = ColText(st, 2);
    r.content_type     = static_cast<recall::scheduler::v1::ContentType>(ColI32(st, 3));
    r.review_count     = static_cast<uint32_t>(ColI32(st, 4));
    r.ease_factor      = sqlite3_column_double(st, 5);
    r.interval_days    = static_cast<uint32_t>(ColI32(st, 6));
    r.last_reviewed_ms = ColU64(st, 7);
    r.next_review_ms   = ColU64(st, 8);
    r.created_at_ms    = ColU64(st, 9);
    r.updated_at_ms    = ColU64(st, 10);
    r.version          = ColU64(st, 11);
    return r;
}

// column order: RECALL_REVIEW_EVENT_COLUMNS
model::ReviewEventRecord ReadReviewEvent(sqlite3_stmt* st) {
    model::ReviewEventRecord e;
    e.id             = ColText(st, 0);
    e.record_id      = ColText(st, 1);
    e.user_id        = ColText(st, 2);
    e.quality        = ColI32(st, 3);
    e.reviewed_at_ms = ColU64(st, 4);
    e.interval_days  = static_cast<uint32_t>(ColI32(st, 5));
    e.ease_factor    = sqlite3_column_double(st, 6);
    e.first_review   = ColI32(st, 7) != 0;
    return e;
}

std::vector<model::ReviewRecord> ReadReviewRecords(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::ReviewRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadReviewRecord(st));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

bool SqliteRepository::StepRow(sqlite3* db, sqlite3_stmt* st) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    throw std::runtime_error("sqlite step: " + Translate(db, rc).message);
}

// ------------------------------------------------------------------
// Review records
// ------------------------------------------------------------------

Result SqliteRepository::InsertReviewRecord(Transaction& t, const model::ReviewRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::INSERT_REVIEW_RECORD);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.user_id);
    BindText(st.get(), 3, r.content_id);
    BindI32(st.get(), 4, static_cast<int>(r.content_type));
    BindI32(st.get(), 5, static_cast<int>(r.review_count));
    BindDouble(st.get(), 6, r.ease_factor);
    BindI32(st.get(), 7, static_cast<int>(r.interval_days));
    BindU64(st.get(), 8, r.last_reviewed_ms);
    BindU64(st.get(), 9, r.next_review_ms);
    BindU64(st.get(), 10, r.created_at_ms);
    BindU64(st.get(), 11, r.updated_at_ms);
    BindU64(st.get(), 12, r.version);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ReviewRecord>
SqliteRepository::GetReviewRecord(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_REVIEW_RECORD);

    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get()))
        return std::nullopt;
    return ReadReviewRecord(st.get());
}

std::optional<model::ReviewRecord>
SqliteRepository::FindReviewRecordByContent(Transaction& t, const std::string& user_id, const std::string& content_id,
                                            recall::scheduler::v1::ContentType content_type) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_REVIEW_RECORD_BY_CONTENT);

    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, content_id);
    BindI32(st.get(), 3, static_cast<int>(content_type));

    if (!StepRow(db, st.get()))
        return std::nullopt;
    return ReadReviewRecord(st.get());
}

std::vector<model::ReviewRecord>
SqliteRepository::ListReviewRecords(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_REVIEW_RECORDS_BY_USER);

    BindText(st.get(), 1, user_id);
    return ReadReviewRecords(db, st.get());
}

std::vector<model::ReviewRecord>
SqliteRepository::ListDueReviewRecords(Transaction& t, const std::string& user_id, uint64_t now_ms) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_DUE_REVIEW_RECORDS);

    BindText(st.get(), 1, user_id);
    BindU64(st.get(), 2, now_ms);
    return ReadReviewRecords(db, st.get());
}

Result SqliteRepository::UpdateReviewRecord(Transaction& t, const model::ReviewRecord& r, uint64_t expected_version) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPDATE_REVIEW_RECORD);

    BindI32(st.get(), 1, static_cast<int>(r.review_count));
    BindDouble(st.get(), 2, r.ease_factor);
    BindI32(st.get(), 3, static_cast<int>(r.interval_days));
    BindU64(st.get(), 4, r.last_reviewed_ms);
    BindU64(st.get(), 5, r.next_review_ms);
    BindU64(st.get(), 6, r.updated_at_ms);
    BindU64(st.get(), 7, r.version);
    BindText(st.get(), 8, r.id);
    BindU64(st.get(), 9, expected_version);

    const auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) > 0) return Result::Ok();

    auto exists = Prepare(db, sql::SELECT_REVIEW_RECORD_EXISTS);
    BindText(exists.get(), 1, r.id);
    if (sqlite3_step(exists.get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "version changed, expected " + std::to_string(expected_version));
}

Result SqliteRepository::DeleteReviewRecord(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    // events first: explicit rather than relying on the connection's foreign_keys pragma
    auto events = Prepare(db, sql::DELETE_REVIEW_EVENTS_FOR_RECORD);
    BindText(events.get(), 1, id);
    const auto events_result = Translate(db, sqlite3_step(events.get()));
    if (!events_result) return events_result;

    auto st = Prepare(db, sql::DELETE_REVIEW_RECORD);
    BindText(st.get(), 1, id);
    const auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;

    return sqlite3_changes(db) > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Review events
// ------------------------------------------------------------------

Result SqliteRepository::AppendReviewEvent(Transaction& t, const model::ReviewEventRecord& e) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::INSERT_REVIEW_EVENT);

    BindText(st.get(), 1, e.id);
    BindText(st.get(), 2, e.record_id);
    BindText(st.get(), 3, e.user_id);
    BindI32(st.get(), 4, e.quality);
    BindU64(st.get(), 5, e.reviewed_at_ms);
    BindI32(st.get(), 6, static_cast<int>(e.interval_days));
    BindDouble(st.get(), 7, e.ease_factor);
    BindI32(st.get(), 8, e.first_review ? 1 : 0);

    const auto result = Translate(db, sqlite3_step(st.get()));
    // a missing parent row surfaces as a foreign key failure
    if (result.code == ErrorCode::ConstraintViolation && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_FOREIGNKEY)
        return Result::Err(ErrorCode::NotFound, result.message);
    return result;
}

std::vector<model::ReviewEventRecord>
SqliteRepository::ListReviewEvents(Transaction& t, const std::string& user_id, uint64_t from_ms, uint64_t to_ms) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_REVIEW_EVENTS_IN_RANGE);

    BindText(st.get(), 1, user_id);
    BindU64(st.get(), 2, from_ms);
    BindU64(st.get(), 3, to_ms);

    std::vector<model::ReviewEventRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadReviewEvent(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return out;
}

std::optional<model::ReviewEventRecord>
SqliteRepository::GetLatestReviewEvent(Transaction& t, const std::string& record_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_LATEST_REVIEW_EVENT);

    BindText(st.get(), 1, record_id);

    if (!StepRow(db, st.get()))
        return std::nullopt;
    return ReadReviewEvent(st.get());
}

uint64_t SqliteRepository::CountReviewEvents(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::COUNT_REVIEW_EVENTS);

    BindText(st.get(), 1, user_id);

    if (!StepRow(db, st.get()))
        return 0;
    return ColU64(st.get(), 0);
}

} // namespace recall::db::sqlite
