#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/scheduling/due_classifier.hpp"
#include "internal/util/time.hpp"
#include "recall/scheduler/v1/types.pb.h"

namespace recall::core {

/*
  Owns the review record lifecycle: schedule, due listing, completion,
  deletion.

  Every operation is scoped to one user. "now" is always supplied by the
  caller.

  Completion concurrency:
  - in-process completions of one record are serialized by a per-record
    mutex; different records never share a lock
  - across processes the repository compare-and-swap on version decides,
    the loser is re-checked once against the replay guard and otherwise
    fails with util::Conflict
*/
class ReviewScheduler {
 public:
  struct Options {
    uint32_t                  default_due_limit = 50;
    uint32_t                  max_due_limit     = 500;
    std::chrono::milliseconds replay_window{std::chrono::seconds(30)};
  };

  struct ScheduleResult {
    db::model::ReviewRecord record;
    bool                    created = false;
  };

  struct DueEntry {
    db::model::ReviewRecord        record;
    scheduling::DueClassification classification;
  };

  struct CompletionResult {
    db::model::ReviewRecord record;
    bool                    replayed = false;
  };

  explicit ReviewScheduler(std::shared_ptr<db::Repository> repository);
  ReviewScheduler(std::shared_ptr<db::Repository> repository, Options options);

  // Idempotent: returns the existing record when the item is already scheduled.
  ScheduleResult Schedule(const std::string& user_id, const std::string& content_id, recall::scheduler::v1::ContentType content_type,
                          util::TimePoint now);

  // Due records, most overdue first, then by next_review, then by id.
  std::vector<DueEntry> ListDue(const std::string& user_id, uint32_t limit, util::TimePoint now);

  CompletionResult CompleteReview(const std::string& user_id, const std::string& record_id, int quality, util::TimePoint now,
                                  std::optional<uint64_t> expected_version = std::nullopt);

  void Delete(const std::string& user_id, const std::string& record_id);

  db::model::ReviewRecord Get(const std::string& user_id, const std::string& record_id);

  // 0 -> default, clamped to the maximum.
  uint32_t EffectiveLimit(uint32_t requested) const;

  const Options& GetOptions() const {
    return options_;
  }

  // Number of per-record locks currently held or awaited.
  size_t ActiveRecordLocks() const;

 private:
  enum class ReplayCheck {
    kNone,
    kReplay,
  };

  db::model::ReviewRecord    LoadOwned(db::Transaction& tx, const std::string& user_id, const std::string& record_id, const char* context);
  ReplayCheck                CheckReplay(db::Transaction& tx, const db::model::ReviewRecord& record, int quality, util::TimePoint now);

  // Holds the per-record mutex; the map entry is dropped by its last holder.
  class RecordLock {
   public:
    RecordLock(ReviewScheduler& owner, const std::string& record_id);
    ~RecordLock();

    RecordLock(const RecordLock&)            = delete;
    RecordLock& operator=(const RecordLock&) = delete;

   private:
    ReviewScheduler&            owner_;
    std::string                 record_id_;
    std::shared_ptr<std::mutex> mutex_;
  };

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;

  mutable std::mutex                                           record_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> record_mutexes_;
};

} // namespace recall::core
