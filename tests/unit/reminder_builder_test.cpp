#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/review_scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/stats/reminder_builder.hpp"

namespace {

using recall::core::ReviewScheduler;
using recall::db::memory::MemoryRepository;
using recall::stats::ReminderBuilder;
using namespace recall::scheduler::v1;
using namespace std::chrono_literals;

const recall::util::TimePoint kNow = recall::util::TimePoint(std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}) + 10h;

void TestRemindersOrderedByPriority() {
  auto            repository = std::make_shared<MemoryRepository>();
  ReviewScheduler scheduler(repository);
  ReminderBuilder reminders(repository);

  // new records are due at their schedule time
  const auto soon    = scheduler.Schedule("alice", "soon", CONTENT_TYPE_QUESTION, kNow + 90min).record.id;
  const auto due     = scheduler.Schedule("alice", "due", CONTENT_TYPE_QUESTION, kNow - 5h).record.id;
  const auto overdue = scheduler.Schedule("alice", "overdue", CONTENT_TYPE_QUESTION, kNow - 50h).record.id;
  scheduler.Schedule("alice", "later", CONTENT_TYPE_QUESTION, kNow + 3h);
  scheduler.Schedule("bob", "theirs", CONTENT_TYPE_QUESTION, kNow - 50h);

  const auto out = reminders.Build("alice", kNow);
  assert(out.size() == 3);

  assert(out[0].record().id() == overdue);
  assert(out[0].priority() == REMINDER_PRIORITY_HIGH);
  assert(out[0].days_overdue() == 2);
  assert(out[0].hours_overdue() == 50);
  assert(out[0].message() == "Review overdue by 2 days");

  assert(out[1].record().id() == due);
  assert(out[1].priority() == REMINDER_PRIORITY_NORMAL);
  assert(out[1].hours_overdue() == 5);
  assert(out[1].message() == "Review due now");

  assert(out[2].record().id() == soon);
  assert(out[2].priority() == REMINDER_PRIORITY_LOW);
  assert(out[2].hours_until_due() == 1);
  assert(out[2].message() == "Review due in 1 hours");
}

void TestDueSoonWindowIsConfigurable() {
  auto            repository = std::make_shared<MemoryRepository>();
  ReviewScheduler scheduler(repository);
  scheduler.Schedule("alice", "later", CONTENT_TYPE_QUESTION, kNow + 3h);

  assert(ReminderBuilder(repository).Build("alice", kNow).empty());
  assert(ReminderBuilder(repository, 4h).Build("alice", kNow).size() == 1);
}

void TestReviewedItemsDropOut() {
  auto            repository = std::make_shared<MemoryRepository>();
  ReviewScheduler scheduler(repository);
  ReminderBuilder reminders(repository);

  const auto id = scheduler.Schedule("alice", "q", CONTENT_TYPE_QUESTION, kNow - 1h).record.id;
  assert(reminders.Build("alice", kNow).size() == 1);

  scheduler.CompleteReview("alice", id, 5, kNow);
  assert(reminders.Build("alice", kNow).empty());
}

} // namespace

int main() {
  TestRemindersOrderedByPriority();
  TestDueSoonWindowIsConfigurable();
  TestReviewedItemsDropOut();

  std::cout << "recall_unit_reminder_builder: pass\n";
  return 0;
}
