#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/review_scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using recall::core::ReviewScheduler;
using recall::db::memory::MemoryRepository;
using namespace recall::scheduler::v1;
using namespace std::chrono_literals;

const recall::util::TimePoint kNow = recall::util::TimePoint(std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}) + 10h;

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  ReviewScheduler                   scheduler{repository};
};

void TestScheduleCreatesDueRecord() {
  Fixture f;

  const auto result = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow);
  assert(result.created);
  assert(!result.record.id.empty());
  assert(result.record.review_count == 0);
  assert(result.record.ease_factor == 2.5);
  assert(result.record.last_reviewed_ms == 0);
  assert(result.record.next_review_ms == recall::util::ToUnixMillis(kNow));
  assert(result.record.version == 1);

  const auto due = f.scheduler.ListDue("alice", 0, kNow);
  assert(due.size() == 1);
  assert(due[0].record.id == result.record.id);
  assert(due[0].classification.days_overdue == 0);
}

void TestScheduleIsIdempotent() {
  Fixture f;

  const auto first  = f.scheduler.Schedule("alice", "kp-7", CONTENT_TYPE_KNOWLEDGE_POINT, kNow);
  const auto second = f.scheduler.Schedule("alice", "kp-7", CONTENT_TYPE_KNOWLEDGE_POINT, kNow + 1h);
  assert(first.created);
  assert(!second.created);
  assert(second.record.id == first.record.id);
  assert(second.record.created_at_ms == first.record.created_at_ms);

  // same content id under a different type or user is a different item
  assert(f.scheduler.Schedule("alice", "kp-7", CONTENT_TYPE_QUESTION, kNow).created);
  assert(f.scheduler.Schedule("bob", "kp-7", CONTENT_TYPE_KNOWLEDGE_POINT, kNow).created);
}

void TestScheduleValidatesInput() {
  Fixture f;
  ExpectThrows<recall::util::InvalidArgument>([&] { f.scheduler.Schedule("alice", "", CONTENT_TYPE_QUESTION, kNow); });
  ExpectThrows<recall::util::InvalidArgument>([&] { f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_UNSPECIFIED, kNow); });
  ExpectThrows<recall::util::InvalidArgument>([&] { f.scheduler.Schedule("", "q-1", CONTENT_TYPE_QUESTION, kNow); });
}

void TestCompleteReviewScenario() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;

  auto result = f.scheduler.CompleteReview("alice", id, 4, kNow);
  assert(!result.replayed);
  assert(result.record.review_count == 1);
  assert(result.record.interval_days == 1);
  assert(std::fabs(result.record.ease_factor - 2.5) < 1e-9);
  assert(result.record.version == 2);
  assert(result.record.next_review_ms == recall::util::ToUnixMillis(kNow + 24h));

  // no longer due until tomorrow
  assert(f.scheduler.ListDue("alice", 0, kNow + 1min).empty());
  assert(f.scheduler.ListDue("alice", 0, kNow + 24h).size() == 1);

  result = f.scheduler.CompleteReview("alice", id, 5, kNow + 24h);
  assert(result.record.interval_days == 6);
  assert(result.record.review_count == 2);

  const auto stored = f.scheduler.Get("alice", id);
  assert(stored.version == 3);
  assert(stored.next_review_ms == recall::util::ToUnixMillis(kNow + 24h + 6 * 24h));
}

void TestCompleteReviewErrors() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;

  ExpectThrows<recall::util::InvalidQuality>([&] { f.scheduler.CompleteReview("alice", id, 7, kNow); });
  ExpectThrows<recall::util::NotFound>([&] { f.scheduler.CompleteReview("alice", "missing", 3, kNow); });
  ExpectThrows<recall::util::Forbidden>([&] { f.scheduler.CompleteReview("bob", id, 3, kNow); });

  // rejected calls never touch the record
  assert(f.scheduler.Get("alice", id).version == 1);
}

void TestRecordLocksDoNotAccumulate() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;

  for (int i = 0; i < 1000; ++i) {
    ExpectThrows<recall::util::NotFound>([&] { f.scheduler.CompleteReview("alice", "nope-" + std::to_string(i), 4, kNow); });
  }
  ExpectThrows<recall::util::Forbidden>([&] { f.scheduler.CompleteReview("bob", id, 4, kNow); });
  assert(f.scheduler.ActiveRecordLocks() == 0);

  f.scheduler.CompleteReview("alice", id, 4, kNow);
  assert(f.scheduler.ActiveRecordLocks() == 0);

  f.scheduler.Delete("alice", id);
  assert(f.scheduler.ActiveRecordLocks() == 0);
}

void TestReplayWithinWindow() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;

  const auto first  = f.scheduler.CompleteReview("alice", id, 3, kNow);
  const auto replay = f.scheduler.CompleteReview("alice", id, 3, kNow + 10s);
  assert(!first.replayed);
  assert(replay.replayed);
  assert(replay.record.version == first.record.version);
  assert(replay.record.review_count == 1);

  // different quality inside the window is a conflicting submission
  ExpectThrows<recall::util::Conflict>([&] { f.scheduler.CompleteReview("alice", id, 5, kNow + 10s); });

  // outside the window the same quality is a new review
  const auto later = f.scheduler.CompleteReview("alice", id, 3, kNow + 31s);
  assert(!later.replayed);
  assert(later.record.review_count == 2);
}

void TestExpectedVersionMismatch() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;

  ExpectThrows<recall::util::Conflict>([&] { f.scheduler.CompleteReview("alice", id, 4, kNow, 5); });
  const auto ok = f.scheduler.CompleteReview("alice", id, 4, kNow, 1);
  assert(ok.record.version == 2);
}

void TestListDueOrderingAndLimit() {
  Fixture f;
  ReviewScheduler::Options options;
  options.default_due_limit = 2;
  options.max_due_limit     = 3;
  ReviewScheduler scheduler(f.repository, options);

  // scheduled at different times so next_review differs
  const auto a = scheduler.Schedule("alice", "a", CONTENT_TYPE_QUESTION, kNow - 50h).record.id;
  const auto b = scheduler.Schedule("alice", "b", CONTENT_TYPE_QUESTION, kNow - 1h).record.id;
  const auto c = scheduler.Schedule("alice", "c", CONTENT_TYPE_QUESTION, kNow - 26h).record.id;
  const auto d = scheduler.Schedule("alice", "d", CONTENT_TYPE_QUESTION, kNow - 2h).record.id;
  scheduler.Schedule("alice", "e", CONTENT_TYPE_QUESTION, kNow + 1h);
  scheduler.Schedule("bob", "x", CONTENT_TYPE_QUESTION, kNow - 100h);

  auto due = scheduler.ListDue("alice", 10, kNow);
  assert(due.size() == 3); // clamped to max
  assert(due[0].record.id == a);
  assert(due[0].classification.days_overdue == 2);
  assert(due[1].record.id == c);
  assert(due[2].record.id == d);

  due = scheduler.ListDue("alice", 0, kNow);
  assert(due.size() == 2);

  due = scheduler.ListDue("alice", 4, kNow);
  assert(due.size() == 3);
  (void)b;

  assert(scheduler.EffectiveLimit(0) == 2);
  assert(scheduler.EffectiveLimit(1) == 1);
  assert(scheduler.EffectiveLimit(1000) == 3);
}

void TestDeleteRemovesRecordAndHistory() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;
  f.scheduler.CompleteReview("alice", id, 4, kNow);

  ExpectThrows<recall::util::Forbidden>([&] { f.scheduler.Delete("bob", id); });
  f.scheduler.Delete("alice", id);

  ExpectThrows<recall::util::NotFound>([&] { f.scheduler.Get("alice", id); });
  ExpectThrows<recall::util::NotFound>([&] { f.scheduler.Delete("alice", id); });

  auto tx = f.repository->Begin();
  assert(f.repository->CountReviewEvents(*tx, "alice") == 0);
  assert(!f.repository->GetLatestReviewEvent(*tx, id).has_value());
  tx->Commit();

  // the content can be scheduled again from scratch
  const auto again = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow);
  assert(again.created);
  assert(again.record.id != id);
}

void TestCompletionAppendsEvent() {
  Fixture f;
  const auto id = f.scheduler.Schedule("alice", "q-1", CONTENT_TYPE_QUESTION, kNow).record.id;
  f.scheduler.CompleteReview("alice", id, 2, kNow);
  f.scheduler.CompleteReview("alice", id, 4, kNow + 24h);

  auto tx     = f.repository->Begin();
  auto events = f.repository->ListReviewEvents(*tx, "alice", 0, recall::util::ToUnixMillis(kNow + 48h));
  tx->Commit();

  assert(events.size() == 2);
  assert(events[0].quality == 2);
  assert(events[0].first_review);
  assert(events[0].interval_days == 1);
  assert(events[1].quality == 4);
  assert(!events[1].first_review);
  assert(events[1].record_id == id);
}

} // namespace

int main() {
  TestScheduleCreatesDueRecord();
  TestScheduleIsIdempotent();
  TestScheduleValidatesInput();
  TestCompleteReviewScenario();
  TestCompleteReviewErrors();
  TestRecordLocksDoNotAccumulate();
  TestReplayWithinWindow();
  TestExpectedVersionMismatch();
  TestListDueOrderingAndLimit();
  TestDeleteRemovesRecordAndHistory();
  TestCompletionAppendsEvent();

  std::cout << "recall_unit_review_scheduler: pass\n";
  return 0;
}
