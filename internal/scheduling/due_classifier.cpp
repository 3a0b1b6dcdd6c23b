#include "due_classifier.hpp"

namespace recall::scheduling {

using recall::scheduler::v1::DUE_STATUS_DUE;
using recall::scheduler::v1::DUE_STATUS_UPCOMING;

DueClassification Classify(const db::model::ReviewRecord& record, util::TimePoint now) {
  const int64_t now_ms  = static_cast<int64_t>(util::ToUnixMillis(now));
  const int64_t next_ms = static_cast<int64_t>(record.next_review_ms);
  const int64_t day_ms  = util::kMillisPerDay.count();

  DueClassification out;
  if (next_ms <= now_ms) {
    out.status       = DUE_STATUS_DUE;
    out.days_overdue = (now_ms - next_ms) / day_ms; // non-negative, so division floors
    return out;
  }

  out.status     = DUE_STATUS_UPCOMING;
  out.days_until = (next_ms - now_ms + day_ms - 1) / day_ms;
  return out;
}

recall::scheduler::v1::ReminderPriority PriorityFor(const DueClassification& classification, const db::model::ReviewRecord& record,
                                                    util::TimePoint now, std::chrono::milliseconds due_soon_window) {
  if (classification.status == DUE_STATUS_DUE) {
    return classification.days_overdue > 0 ? recall::scheduler::v1::REMINDER_PRIORITY_HIGH : recall::scheduler::v1::REMINDER_PRIORITY_NORMAL;
  }

  const uint64_t horizon_ms = util::ToUnixMillis(now) + static_cast<uint64_t>(due_soon_window.count());
  if (classification.status == DUE_STATUS_UPCOMING && record.next_review_ms <= horizon_ms) {
    return recall::scheduler::v1::REMINDER_PRIORITY_LOW;
  }
  return recall::scheduler::v1::REMINDER_PRIORITY_UNSPECIFIED;
}

} // namespace recall::scheduling
