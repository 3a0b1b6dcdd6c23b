#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"

namespace recall::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

std::string ErrorText(sqlite3* db, const char* fallback) {
  return db != nullptr ? sqlite3_errmsg(db) : fallback;
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const auto msg = ErrorText(db_, "sqlite open failed");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  try {
    ApplyPragmas();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string msg = err != nullptr ? err : ErrorText(db_, "sqlite exec failed");
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite user_version: " + ErrorText(db_, "prepare failed"));
  }
  const int version = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::ApplySchema() {
  auto lock = LockForTransaction();

  const int found = SchemaVersion();
  if (found > sql::kSchemaVersion) {
    throw std::runtime_error("sqlite " + path_ + " has schema version " + std::to_string(found) + ", this build supports up to " +
                             std::to_string(sql::kSchemaVersion));
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& statement : sql::SqliteSchema()) Exec(statement);
    Exec("PRAGMA user_version=" + std::to_string(sql::kSchemaVersion) + ";");
    Exec("COMMIT;");
  } catch (const std::exception&) {
    if (!sqlite3_get_autocommit(db_)) Exec("ROLLBACK;");
    throw;
  }

  if (found != sql::kSchemaVersion) {
    RECALL_LOG_INFO("sqlite schema applied", {observability::StringField("path", path_), observability::IntField("from_version", found),
                                              observability::IntField("to_version", sql::kSchemaVersion)});
  }
}

void SqliteDB::ApplyPragmas() {
  // WAL keeps readers in other processes unblocked during a review write
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error("sqlite busy_timeout: " + ErrorText(db_, "failed"));
  }
}

} // namespace recall::db::sqlite
