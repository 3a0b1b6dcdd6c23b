#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace {

using recall::db::sqlite::SqliteDB;
using recall::db::sqlite::SqliteRepository;
using recall::db::sqlite::SqliteTransaction;

struct Fixture {
  std::filesystem::path             path = std::filesystem::temp_directory_path() / "recall_unit_sqlite_repository.sqlite";
  std::shared_ptr<SqliteRepository> repository;

  Fixture() {
    std::filesystem::remove(path);
    auto db = std::make_shared<SqliteDB>(path.string());
    db->ApplySchema();
    repository = std::make_shared<SqliteRepository>(std::move(db));
  }

  ~Fixture() {
    repository.reset();
    std::filesystem::remove(path);
  }
};

int AbortStep(void*) {
  return 1;
}

template <typename Fn>
void ExpectStepFailure(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingRowsAreAbsent() {
  Fixture f;
  auto    tx = f.repository->Begin();

  assert(!f.repository->GetReviewRecord(*tx, "missing").has_value());
  assert(!f.repository->FindReviewRecordByContent(*tx, "alice", "q-1", recall::scheduler::v1::CONTENT_TYPE_QUESTION).has_value());
  assert(!f.repository->GetLatestReviewEvent(*tx, "missing").has_value());
  assert(f.repository->CountReviewEvents(*tx, "alice") == 0);
  tx->Commit();
}

// An interrupted step is a failed read, never an empty one.
void TestStepErrorsAreNotReportedAsAbsent() {
  Fixture f;
  auto    tx     = f.repository->Begin();
  auto*   handle = static_cast<SqliteTransaction&>(*tx).Handle();

  sqlite3_progress_handler(handle, 1, &AbortStep, nullptr);

  ExpectStepFailure([&] { f.repository->GetReviewRecord(*tx, "missing"); });
  ExpectStepFailure([&] {
    f.repository->FindReviewRecordByContent(*tx, "alice", "q-1", recall::scheduler::v1::CONTENT_TYPE_QUESTION);
  });
  ExpectStepFailure([&] { f.repository->GetLatestReviewEvent(*tx, "missing"); });
  ExpectStepFailure([&] { f.repository->CountReviewEvents(*tx, "alice"); });
  ExpectStepFailure([&] { f.repository->ListReviewRecords(*tx, "alice"); });

  sqlite3_progress_handler(handle, 0, nullptr, nullptr);
  tx->Rollback();
}

} // namespace

int main() {
  TestMissingRowsAreAbsent();
  TestStepErrorsAreNotReportedAsAbsent();

  std::cout << "recall_unit_sqlite_repository: pass\n";
  return 0;
}
