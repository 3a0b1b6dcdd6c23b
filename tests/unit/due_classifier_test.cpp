#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/scheduling/due_classifier.hpp"

namespace {

using recall::db::model::ReviewRecord;
using namespace recall::scheduler::v1;
using namespace std::chrono_literals;

const recall::util::TimePoint kNow = recall::util::TimePoint(std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}) + 10h;

ReviewRecord RecordDueAt(recall::util::TimePoint next_review) {
  ReviewRecord record;
  record.id             = "rec";
  record.next_review_ms = recall::util::ToUnixMillis(next_review);
  return record;
}

void TestDueExactlyAtNow() {
  const auto c = recall::scheduling::Classify(RecordDueAt(kNow), kNow);
  assert(c.status == DUE_STATUS_DUE);
  assert(c.days_overdue == 0);
}

void TestOverdueFloorsWholeDays() {
  auto c = recall::scheduling::Classify(RecordDueAt(kNow - 47h), kNow);
  assert(c.status == DUE_STATUS_DUE);
  assert(c.days_overdue == 1);

  c = recall::scheduling::Classify(RecordDueAt(kNow - 48h), kNow);
  assert(c.days_overdue == 2);
}

void TestUpcomingRoundsUp() {
  auto c = recall::scheduling::Classify(RecordDueAt(kNow + 1ms), kNow);
  assert(c.status == DUE_STATUS_UPCOMING);
  assert(c.days_until == 1);

  c = recall::scheduling::Classify(RecordDueAt(kNow + 24h), kNow);
  assert(c.days_until == 1);

  c = recall::scheduling::Classify(RecordDueAt(kNow + 25h), kNow);
  assert(c.days_until == 2);
}

void TestPriorityLadder() {
  const auto window = std::chrono::milliseconds(2h);

  const auto overdue = RecordDueAt(kNow - 30h);
  assert(recall::scheduling::PriorityFor(recall::scheduling::Classify(overdue, kNow), overdue, kNow, window) == REMINDER_PRIORITY_HIGH);

  const auto due = RecordDueAt(kNow - 3h);
  assert(recall::scheduling::PriorityFor(recall::scheduling::Classify(due, kNow), due, kNow, window) == REMINDER_PRIORITY_NORMAL);

  const auto soon = RecordDueAt(kNow + 2h);
  assert(recall::scheduling::PriorityFor(recall::scheduling::Classify(soon, kNow), soon, kNow, window) == REMINDER_PRIORITY_LOW);

  const auto later = RecordDueAt(kNow + 3h);
  assert(recall::scheduling::PriorityFor(recall::scheduling::Classify(later, kNow), later, kNow, window) == REMINDER_PRIORITY_UNSPECIFIED);
}

} // namespace

int main() {
  TestDueExactlyAtNow();
  TestOverdueFloorsWholeDays();
  TestUpcomingRoundsUp();
  TestPriorityLadder();

  std::cout << "recall_unit_due_classifier: pass\n";
  return 0;
}
