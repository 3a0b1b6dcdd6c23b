#pragma once

#include <chrono>
#include <cstdint>

#include "internal/db/model/review_record.hpp"
#include "internal/util/time.hpp"
#include "recall/scheduler/v1/types.pb.h"

namespace recall::scheduling {

struct DueClassification {
  recall::scheduler::v1::DueStatus status = recall::scheduler::v1::DUE_STATUS_UNSPECIFIED;
  int64_t days_overdue = 0; // Due only: whole days past next_review
  int64_t days_until   = 0; // Upcoming only: days rounded up
};

/*
  Due:      next_review <= now, days_overdue = floor((now - next_review) / day)
  Upcoming: next_review >  now, days_until   = ceil((next_review - now) / day)
*/
DueClassification Classify(const db::model::ReviewRecord& record, util::TimePoint now);

/*
  Reminder priority:
    overdue by a day or more  -> HIGH
    due, less than a day late -> NORMAL
    upcoming within due_soon  -> LOW
    anything else             -> UNSPECIFIED (no reminder)
*/
recall::scheduler::v1::ReminderPriority PriorityFor(const DueClassification& classification, const db::model::ReviewRecord& record,
                                                    util::TimePoint now, std::chrono::milliseconds due_soon_window);

} // namespace recall::scheduling
