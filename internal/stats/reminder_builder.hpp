#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "recall/scheduler/v1/types.pb.h"

namespace recall::stats {

/*
  Review reminders for one user: overdue (HIGH), due today (NORMAL) and
  due within the due-soon window (LOW), in that order, then by
  next_review.
*/
class ReminderBuilder {
 public:
  explicit ReminderBuilder(std::shared_ptr<db::Repository> repository,
                           std::chrono::milliseconds       due_soon_window = std::chrono::hours(2));

  std::vector<recall::scheduler::v1::Reminder> Build(const std::string& user_id, util::TimePoint now);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       due_soon_window_;
};

} // namespace recall::stats
