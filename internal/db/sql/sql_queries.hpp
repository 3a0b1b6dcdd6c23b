#pragma once

namespace recall::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres uses the same column lists with $n placeholders (see
  pg_repository.cpp prepared statements).
*/

#define RECALL_REVIEW_RECORD_COLUMNS                                                                                        \
  "id,user_id,content_id,content_type,review_count,ease_factor,interval_days,last_reviewed_ms,next_review_ms,created_at_ms," \
  "updated_at_ms,version"

#define RECALL_REVIEW_EVENT_COLUMNS "id,record_id,user_id,quality,reviewed_at_ms,interval_days,ease_factor,first_review"

static constexpr const char* INSERT_REVIEW_RECORD =
    "INSERT INTO review_record(" RECALL_REVIEW_RECORD_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_REVIEW_RECORD =
    "SELECT " RECALL_REVIEW_RECORD_COLUMNS " FROM review_record WHERE id=?;";

static constexpr const char* SELECT_REVIEW_RECORD_BY_CONTENT =
    "SELECT " RECALL_REVIEW_RECORD_COLUMNS " FROM review_record"
    " WHERE user_id=? AND content_id=? AND content_type=?;";

static constexpr const char* SELECT_REVIEW_RECORDS_BY_USER =
    "SELECT " RECALL_REVIEW_RECORD_COLUMNS " FROM review_record WHERE user_id=?;";

static constexpr const char* SELECT_DUE_REVIEW_RECORDS =
    "SELECT " RECALL_REVIEW_RECORD_COLUMNS " FROM review_record"
    " WHERE user_id=? AND next_review_ms<=?;";

// compare-and-swap: zero changed rows means the version moved or the row is gone
static constexpr const char* UPDATE_REVIEW_RECORD =
    "UPDATE review_record SET review_count=?,ease_factor=?,interval_days=?,last_reviewed_ms=?,next_review_ms=?,"
    "updated_at_ms=?,version=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_REVIEW_RECORD_EXISTS =
    "SELECT 1 FROM review_record WHERE id=?;";

static constexpr const char* DELETE_REVIEW_RECORD =
    "DELETE FROM review_record WHERE id=?;";

// events

static constexpr const char* INSERT_REVIEW_EVENT =
    "INSERT INTO review_event(" RECALL_REVIEW_EVENT_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* DELETE_REVIEW_EVENTS_FOR_RECORD =
    "DELETE FROM review_event WHERE record_id=?;";

static constexpr const char* SELECT_REVIEW_EVENTS_IN_RANGE =
    "SELECT " RECALL_REVIEW_EVENT_COLUMNS " FROM review_event"
    " WHERE user_id=? AND reviewed_at_ms>=? AND reviewed_at_ms<?"
    " ORDER BY reviewed_at_ms ASC, id ASC;";

static constexpr const char* SELECT_LATEST_REVIEW_EVENT =
    "SELECT " RECALL_REVIEW_EVENT_COLUMNS " FROM review_event"
    " WHERE record_id=? ORDER BY seq DESC LIMIT 1;";

static constexpr const char* COUNT_REVIEW_EVENTS =
    "SELECT COUNT(*) FROM review_event WHERE user_id=?;";

}
