#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace recall::db::sqlite {

/*
  Owns the single sqlite3 connection of the process.

  Every SqliteTransaction shares it and holds the transaction lock from
  BEGIN to COMMIT/ROLLBACK, so review writes are serialized in-process
  and never nest.
*/
class SqliteDB {
 public:
  // Opens (creating if needed) and applies connection pragmas.
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // Creates review_record / review_event in one transaction and stamps
  // the schema version. Throws if the file was written by a newer schema.
  void ApplySchema();

  int SchemaVersion();

  std::unique_lock<std::mutex> LockForTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void ApplyPragmas();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace recall::db::sqlite
