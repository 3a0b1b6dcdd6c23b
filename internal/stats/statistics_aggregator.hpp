#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "recall/scheduler/v1/stats_service.pb.h"
#include "recall/scheduler/v1/types.pb.h"

namespace recall::stats {

/*
  Read-only aggregates over one user's review records and review events.

  Each public call reads through a single repository transaction, so the
  numbers in one answer agree with each other. Calendar days come from
  the configured CalendarDays.
*/
class StatisticsAggregator {
 public:
  struct Options {
    util::CalendarDays calendar{};
    uint32_t           streak_lookback_days = 365;
  };

  static constexpr uint32_t kMinUpcomingDays = 1;
  static constexpr uint32_t kMaxUpcomingDays = 30;

  explicit StatisticsAggregator(std::shared_ptr<db::Repository> repository);
  StatisticsAggregator(std::shared_ptr<db::Repository> repository, Options options);

  recall::scheduler::v1::StatisticsOverview Overview(const std::string& user_id, util::TimePoint now);

  // Records due in (now, now + days], grouped by calendar date.
  std::vector<recall::scheduler::v1::UpcomingDay> Upcoming(const std::string& user_id, uint32_t days, util::TimePoint now);

  // date defaults to today
  recall::scheduler::v1::DailySummary Daily(const std::string& user_id, std::optional<util::Day> date, util::TimePoint now);

  // week_start defaults to Monday of the current week
  recall::scheduler::v1::WeeklySummary Weekly(const std::string& user_id, std::optional<util::Day> week_start, util::TimePoint now);

  uint32_t LearningStreak(const std::string& user_id, util::TimePoint now);

  // Milestones reached by the completion that was just committed at "now".
  std::vector<recall::scheduler::v1::Achievement> AchievementsAfterCompletion(const std::string& user_id, util::TimePoint now);

  const util::CalendarDays& Calendar() const {
    return options_.calendar;
  }

 private:
  uint32_t StreakFrom(db::Transaction& tx, const std::string& user_id, util::Day today);

  recall::scheduler::v1::DailySummary BuildDaily(util::Day day, const std::vector<db::model::ReviewRecord>& records,
                                                 const std::vector<db::model::ReviewEventRecord>& events) const;

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;
};

} // namespace recall::stats
