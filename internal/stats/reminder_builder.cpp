#include "reminder_builder.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/record_proto.hpp"
#include "internal/scheduling/due_classifier.hpp"
#include "internal/util/errors.hpp"

namespace recall::stats {

using recall::scheduler::v1::Reminder;

namespace {

constexpr int64_t kMillisPerHour = 60 * 60 * 1000;

std::string MessageFor(const Reminder& reminder) {
  switch (reminder.priority()) {
    case recall::scheduler::v1::REMINDER_PRIORITY_HIGH:
      return "Review overdue by " + std::to_string(reminder.days_overdue()) + " days";
    case recall::scheduler::v1::REMINDER_PRIORITY_NORMAL:
      return "Review due now";
    default:
      return "Review due in " + std::to_string(reminder.hours_until_due()) + " hours";
  }
}

} // namespace

ReminderBuilder::ReminderBuilder(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds due_soon_window)
    : repository_(std::move(repository)), due_soon_window_(due_soon_window) {
  if (!repository_) {
    throw std::invalid_argument("ReminderBuilder requires a repository");
  }
}

std::vector<Reminder> ReminderBuilder::Build(const std::string& user_id, util::TimePoint now) {
  if (user_id.empty()) {
    throw util::InvalidArgument("user_id is required");
  }

  const int64_t now_ms = static_cast<int64_t>(util::ToUnixMillis(now));

  auto tx      = repository_->Begin();
  auto records = repository_->ListReviewRecords(*tx, user_id);
  tx->Commit();

  std::vector<Reminder> out;
  for (const auto& record : records) {
    const auto classification = scheduling::Classify(record, now);
    const auto priority       = scheduling::PriorityFor(classification, record, now, due_soon_window_);
    if (priority == recall::scheduler::v1::REMINDER_PRIORITY_UNSPECIFIED) continue;

    const int64_t delta_ms = now_ms - static_cast<int64_t>(record.next_review_ms);

    Reminder reminder;
    *reminder.mutable_record() = core::ToProto(record);
    reminder.set_priority(priority);
    if (classification.status == recall::scheduler::v1::DUE_STATUS_DUE) {
      reminder.set_days_overdue(classification.days_overdue);
      reminder.set_hours_overdue(delta_ms / kMillisPerHour);
    } else {
      reminder.set_hours_until_due(-delta_ms / kMillisPerHour);
    }
    reminder.set_message(MessageFor(reminder));
    out.push_back(std::move(reminder));
  }

  std::sort(out.begin(), out.end(), [](const Reminder& a, const Reminder& b) {
    if (a.priority() != b.priority()) return a.priority() > b.priority();
    const auto& a_next = a.record().next_review();
    const auto& b_next = b.record().next_review();
    if (a_next.seconds() != b_next.seconds()) return a_next.seconds() < b_next.seconds();
    if (a_next.nanos() != b_next.nanos()) return a_next.nanos() < b_next.nanos();
    return a.record().id() < b.record().id();
  });
  return out;
}

} // namespace recall::stats
