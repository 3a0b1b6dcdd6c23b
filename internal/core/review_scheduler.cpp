#include "review_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/scheduling/sm2.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace recall::core {

using recall::scheduler::v1::ContentType;

namespace {

// one retry after a lost compare-and-swap, and only to detect a replay
constexpr int kMaxCompletionAttempts = 2;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

bool IsLostRace(db::ErrorCode code) {
  return code == db::ErrorCode::Conflict || code == db::ErrorCode::SerializationFailure;
}

void RequireUser(const std::string& user_id) {
  if (user_id.empty()) {
    throw util::InvalidArgument("user_id is required");
  }
}

} // namespace

ReviewScheduler::ReviewScheduler(std::shared_ptr<db::Repository> repository) : ReviewScheduler(std::move(repository), Options{}) {
}

ReviewScheduler::ReviewScheduler(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("ReviewScheduler requires a repository");
  }
  if (options_.default_due_limit == 0) options_.default_due_limit = 50;
  if (options_.max_due_limit == 0) options_.max_due_limit = 500;
  options_.default_due_limit = std::min(options_.default_due_limit, options_.max_due_limit);
}

ReviewScheduler::RecordLock::RecordLock(ReviewScheduler& owner, const std::string& record_id) : owner_(owner), record_id_(record_id) {
  {
    std::lock_guard<std::mutex> lock(owner_.record_mutexes_guard_);
    auto&                       slot = owner_.record_mutexes_[record_id_];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    mutex_ = slot;
  }
  mutex_->lock();
}

ReviewScheduler::RecordLock::~RecordLock() {
  mutex_->unlock();

  // References are only taken and dropped under the guard, so a count of two
  // (the map's and ours) means nobody else is waiting.
  std::lock_guard<std::mutex> lock(owner_.record_mutexes_guard_);
  if (mutex_.use_count() == 2) {
    owner_.record_mutexes_.erase(record_id_);
  }
  mutex_.reset();
}

size_t ReviewScheduler::ActiveRecordLocks() const {
  std::lock_guard<std::mutex> lock(record_mutexes_guard_);
  return record_mutexes_.size();
}

uint32_t ReviewScheduler::EffectiveLimit(uint32_t requested) const {
  if (requested == 0) return options_.default_due_limit;
  return std::min(requested, options_.max_due_limit);
}

db::model::ReviewRecord ReviewScheduler::LoadOwned(db::Transaction& tx, const std::string& user_id, const std::string& record_id,
                                                   const char* context) {
  if (record_id.empty()) {
    throw util::InvalidArgument(std::string(context) + ": record_id is required");
  }

  auto record = repository_->GetReviewRecord(tx, record_id);
  if (!record.has_value()) {
    throw util::NotFound(std::string(context) + ": review record " + record_id + " not found");
  }
  if (record->user_id != user_id) {
    throw util::Forbidden(std::string(context) + ": review record " + record_id + " belongs to another user");
  }
  return *record;
}

ReviewScheduler::ReplayCheck ReviewScheduler::CheckReplay(db::Transaction& tx, const db::model::ReviewRecord& record, int quality,
                                                          util::TimePoint now) {
  if (record.last_reviewed_ms == 0) {
    return ReplayCheck::kNone;
  }

  const uint64_t now_ms    = util::ToUnixMillis(now);
  const uint64_t window_ms = static_cast<uint64_t>(options_.replay_window.count());
  if (now_ms >= record.last_reviewed_ms + window_ms) {
    return ReplayCheck::kNone;
  }

  const auto latest = repository_->GetLatestReviewEvent(tx, record.id);
  if (!latest.has_value()) {
    return ReplayCheck::kNone;
  }
  if (latest->quality == quality) {
    return ReplayCheck::kReplay;
  }

  observability::Metrics::Instance().RecordCompletion(observability::CompletionOutcome::kConflict);
  RECALL_LOG_WARN("Conflicting completion inside replay window",
                  {observability::StringField("record_id", record.id), observability::IntField("quality", quality),
                   observability::IntField("previous_quality", latest->quality)});
  throw util::Conflict("complete review: record " + record.id + " was just completed with quality " + std::to_string(latest->quality));
}

ReviewScheduler::ScheduleResult ReviewScheduler::Schedule(const std::string& user_id, const std::string& content_id, ContentType content_type,
                                                          util::TimePoint now) {
  RequireUser(user_id);
  if (content_id.empty()) {
    throw util::InvalidArgument("schedule: content_id is required");
  }
  if (content_type != recall::scheduler::v1::CONTENT_TYPE_QUESTION && content_type != recall::scheduler::v1::CONTENT_TYPE_KNOWLEDGE_POINT) {
    throw util::InvalidArgument("schedule: content_type must be question or knowledge_point");
  }

  {
    auto tx       = repository_->Begin();
    auto existing = repository_->FindReviewRecordByContent(*tx, user_id, content_id, content_type);
    if (existing.has_value()) {
      tx->Commit();
      return {*existing, false};
    }

    const uint64_t          now_ms = util::ToUnixMillis(now);
    db::model::ReviewRecord record;
    record.id             = util::GenerateId();
    record.user_id        = user_id;
    record.content_id     = content_id;
    record.content_type   = content_type;
    record.review_count   = 0;
    record.ease_factor    = scheduling::kInitialEaseFactor;
    record.interval_days  = 0;
    record.next_review_ms = now_ms;
    record.created_at_ms  = now_ms;
    record.updated_at_ms  = now_ms;
    record.version        = 1;

    const auto inserted = repository_->InsertReviewRecord(*tx, record);
    if (inserted) {
      try {
        tx->Commit();
        RECALL_LOG_INFO("Scheduled review item", {observability::StringField("record_id", record.id), observability::StringField("user_id", user_id),
                                                  observability::StringField("content_id", content_id)});
        return {record, true};
      } catch (const db::CommitError& e) {
        if (e.Code() != db::ErrorCode::AlreadyExists) {
          ThrowIfDbError(db::Result::Err(e.Code(), e.what()), "schedule");
        }
      }
    } else if (inserted.code != db::ErrorCode::AlreadyExists) {
      ThrowIfDbError(inserted, "schedule");
    }
  }

  // lost an insert race: the winner's record is the answer
  auto tx     = repository_->Begin();
  auto winner = repository_->FindReviewRecordByContent(*tx, user_id, content_id, content_type);
  if (!winner.has_value()) {
    throw util::Conflict("schedule: concurrent schedule of " + content_id + " did not persist; retry");
  }
  tx->Commit();
  RECALL_LOG_DEBUG("Schedule raced with a concurrent insert", {observability::StringField("record_id", winner->id)});
  return {*winner, false};
}

std::vector<ReviewScheduler::DueEntry> ReviewScheduler::ListDue(const std::string& user_id, uint32_t limit, util::TimePoint now) {
  RequireUser(user_id);

  auto tx      = repository_->Begin();
  auto records = repository_->ListDueReviewRecords(*tx, user_id, util::ToUnixMillis(now));
  tx->Commit();

  std::vector<DueEntry> entries;
  entries.reserve(records.size());
  for (auto& record : records) {
    auto classification = scheduling::Classify(record, now);
    entries.push_back({std::move(record), classification});
  }

  std::sort(entries.begin(), entries.end(), [](const DueEntry& a, const DueEntry& b) {
    if (a.classification.days_overdue != b.classification.days_overdue) {
      return a.classification.days_overdue > b.classification.days_overdue;
    }
    if (a.record.next_review_ms != b.record.next_review_ms) {
      return a.record.next_review_ms < b.record.next_review_ms;
    }
    return a.record.id < b.record.id;
  });

  const auto effective = EffectiveLimit(limit);
  if (entries.size() > effective) {
    entries.resize(effective);
  }
  return entries;
}

ReviewScheduler::CompletionResult ReviewScheduler::CompleteReview(const std::string& user_id, const std::string& record_id, int quality,
                                                                  util::TimePoint now, std::optional<uint64_t> expected_version) {
  scheduling::ValidateQuality(quality);
  RequireUser(user_id);

  RecordLock record_lock(*this, record_id);

  for (int attempt = 0; attempt < kMaxCompletionAttempts; ++attempt) {
    const bool retry = attempt > 0;

    auto tx     = repository_->Begin();
    auto record = LoadOwned(*tx, user_id, record_id, "complete review");

    if (CheckReplay(*tx, record, quality, now) == ReplayCheck::kReplay) {
      tx->Commit();
      observability::Metrics::Instance().RecordCompletion(observability::CompletionOutcome::kReplayed);
      RECALL_LOG_INFO("Completion replayed", {observability::StringField("record_id", record_id), observability::IntField("quality", quality)});
      return {record, true};
    }

    if (retry) {
      break;
    }

    if (expected_version.has_value() && *expected_version != record.version) {
      observability::Metrics::Instance().RecordCompletion(observability::CompletionOutcome::kConflict);
      throw util::Conflict("complete review: record " + record_id + " is at version " + std::to_string(record.version) + ", expected " +
                           std::to_string(*expected_version));
    }

    const auto updated = scheduling::ApplyReview(record, quality, now);

    const auto update_result = repository_->UpdateReviewRecord(*tx, updated, record.version);
    if (IsLostRace(update_result.code)) {
      continue;
    }
    ThrowIfDbError(update_result, "complete review");

    db::model::ReviewEventRecord event;
    event.id             = util::GenerateId();
    event.record_id      = record.id;
    event.user_id        = user_id;
    event.quality        = quality;
    event.reviewed_at_ms = updated.last_reviewed_ms;
    event.interval_days  = updated.interval_days;
    event.ease_factor    = updated.ease_factor;
    event.first_review   = record.review_count == 0;
    ThrowIfDbError(repository_->AppendReviewEvent(*tx, event), "complete review");

    try {
      tx->Commit();
    } catch (const db::CommitError& e) {
      if (IsLostRace(e.Code())) {
        continue;
      }
      ThrowIfDbError(db::Result::Err(e.Code(), e.what()), "complete review");
    }

    observability::Metrics::Instance().RecordCompletion(observability::CompletionOutcome::kApplied, quality);
    RECALL_LOG_INFO("Review completed",
                    {observability::StringField("record_id", record_id), observability::IntField("quality", quality),
                     observability::IntField("interval_days", updated.interval_days), observability::DoubleField("ease_factor", updated.ease_factor),
                     observability::IntField("version", static_cast<int64_t>(updated.version))});
    return {updated, false};
  }

  observability::Metrics::Instance().RecordCompletion(observability::CompletionOutcome::kConflict);
  RECALL_LOG_WARN("Completion lost a concurrent update", {observability::StringField("record_id", record_id), observability::IntField("quality", quality)});
  throw util::Conflict("complete review: record " + record_id + " was updated concurrently; reload and retry");
}

void ReviewScheduler::Delete(const std::string& user_id, const std::string& record_id) {
  RequireUser(user_id);

  {
    RecordLock record_lock(*this, record_id);

    auto tx = repository_->Begin();
    LoadOwned(*tx, user_id, record_id, "delete review record");
    ThrowIfDbError(repository_->DeleteReviewRecord(*tx, record_id), "delete review record");
    try {
      tx->Commit();
    } catch (const db::CommitError& e) {
      ThrowIfDbError(db::Result::Err(e.Code(), e.what()), "delete review record");
    }
  }

  RECALL_LOG_INFO("Deleted review record", {observability::StringField("record_id", record_id), observability::StringField("user_id", user_id)});
}

db::model::ReviewRecord ReviewScheduler::Get(const std::string& user_id, const std::string& record_id) {
  RequireUser(user_id);

  auto tx     = repository_->Begin();
  auto record = LoadOwned(*tx, user_id, record_id, "get review record");
  tx->Commit();
  return record;
}

} // namespace recall::core
