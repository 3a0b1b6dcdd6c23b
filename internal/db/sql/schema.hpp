#pragma once

#include <string>
#include <vector>

namespace recall::db::sql {

inline constexpr int kSchemaVersion = 1;

/*
  Bootstrap DDL, applied in order at startup. Idempotent.

  kSchemaVersion is stamped into the database after bootstrap (SQLite
  user_version); bump it whenever a statement below changes shape.

  review_event.seq orders events of one record by append, independent of
  the reviewed_at clock.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS review_record (id TEXT PRIMARY KEY, user_id TEXT NOT NULL, content_id TEXT NOT NULL, content_type INTEGER NOT NULL, review_count INTEGER NOT NULL, ease_factor REAL NOT NULL, interval_days INTEGER NOT NULL, last_reviewed_ms INTEGER NOT NULL DEFAULT 0, next_review_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL, UNIQUE(user_id, content_id, content_type));",
      "CREATE INDEX IF NOT EXISTS review_record_due_idx ON review_record(user_id, next_review_ms);",
      "CREATE TABLE IF NOT EXISTS review_event (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, record_id TEXT NOT NULL REFERENCES review_record(id) ON DELETE CASCADE, user_id TEXT NOT NULL, quality INTEGER NOT NULL, reviewed_at_ms INTEGER NOT NULL, interval_days INTEGER NOT NULL, ease_factor REAL NOT NULL, first_review INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS review_event_user_time_idx ON review_event(user_id, reviewed_at_ms);",
      "CREATE INDEX IF NOT EXISTS review_event_record_idx ON review_event(record_id, seq);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS review_record (id TEXT PRIMARY KEY, user_id TEXT NOT NULL, content_id TEXT NOT NULL, content_type SMALLINT NOT NULL, review_count INTEGER NOT NULL, ease_factor DOUBLE PRECISION NOT NULL, interval_days INTEGER NOT NULL, last_reviewed_ms BIGINT NOT NULL DEFAULT 0, next_review_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL, UNIQUE(user_id, content_id, content_type));",
      "CREATE INDEX IF NOT EXISTS review_record_due_idx ON review_record(user_id, next_review_ms);",
      "CREATE TABLE IF NOT EXISTS review_event (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, record_id TEXT NOT NULL REFERENCES review_record(id) ON DELETE CASCADE, user_id TEXT NOT NULL, quality SMALLINT NOT NULL, reviewed_at_ms BIGINT NOT NULL, interval_days INTEGER NOT NULL, ease_factor DOUBLE PRECISION NOT NULL, first_review BOOLEAN NOT NULL);",
      "CREATE INDEX IF NOT EXISTS review_event_user_time_idx ON review_event(user_id, reviewed_at_ms);",
      "CREATE INDEX IF NOT EXISTS review_event_record_idx ON review_event(record_id, seq);"};
  return kSchema;
}

}
