#include "statistics_aggregator.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <map>
#include <set>
#include <stdexcept>

#include "internal/core/record_proto.hpp"
#include "internal/scheduling/due_classifier.hpp"
#include "internal/util/errors.hpp"

namespace recall::stats {

using recall::scheduler::v1::Achievement;
using recall::scheduler::v1::DailySummary;
using recall::scheduler::v1::StatisticsOverview;
using recall::scheduler::v1::UpcomingDay;
using recall::scheduler::v1::WeeklySummary;

namespace {

constexpr std::array<uint32_t, 6> kStreakMilestones = {7, 14, 30, 60, 100, 365};
constexpr std::array<uint32_t, 6> kReviewMilestones = {10, 50, 100, 250, 500, 1000};

bool IsMilestone(const std::array<uint32_t, 6>& milestones, uint64_t value) {
  return std::find(milestones.begin(), milestones.end(), value) != milestones.end();
}

uint64_t Ms(util::TimePoint tp) {
  return util::ToUnixMillis(tp);
}

void RequireUser(const std::string& user_id) {
  if (user_id.empty()) {
    throw util::InvalidArgument("user_id is required");
  }
}

util::Day MondayOf(util::Day day) {
  const std::chrono::weekday wd{day};
  const unsigned             days_since_monday = (wd.c_encoding() + 6) % 7;
  return day - std::chrono::days(days_since_monday);
}

Achievement MakeAchievement(recall::scheduler::v1::AchievementType type, uint32_t value, std::string title, std::string message) {
  Achievement a;
  a.set_type(type);
  a.set_value(value);
  a.set_title(std::move(title));
  a.set_message(std::move(message));
  return a;
}

} // namespace

StatisticsAggregator::StatisticsAggregator(std::shared_ptr<db::Repository> repository)
    : StatisticsAggregator(std::move(repository), Options{}) {
}

StatisticsAggregator::StatisticsAggregator(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("StatisticsAggregator requires a repository");
  }
  if (options_.streak_lookback_days == 0) {
    options_.streak_lookback_days = 365;
  }
}

uint32_t StatisticsAggregator::StreakFrom(db::Transaction& tx, const std::string& user_id, util::Day today) {
  const auto& calendar = options_.calendar;
  const auto  oldest   = today - std::chrono::days(options_.streak_lookback_days);

  const auto events = repository_->ListReviewEvents(tx, user_id, Ms(calendar.StartOf(oldest)), Ms(calendar.EndOf(today)));

  std::set<util::Day> active_days;
  for (const auto& event : events) {
    active_days.insert(calendar.DayOf(util::FromUnixMillis(event.reviewed_at_ms)));
  }

  // a streak may end yesterday while today has no reviews yet
  auto day = today;
  if (!active_days.contains(day)) {
    day -= std::chrono::days(1);
  }

  uint32_t streak = 0;
  while (day >= oldest && active_days.contains(day)) {
    ++streak;
    day -= std::chrono::days(1);
  }
  return streak;
}

StatisticsOverview StatisticsAggregator::Overview(const std::string& user_id, util::TimePoint now) {
  RequireUser(user_id);

  const auto& calendar = options_.calendar;
  const auto  today    = calendar.DayOf(now);
  const auto  week_end = Ms(calendar.StartOf(today + std::chrono::days(7)));

  auto tx      = repository_->Begin();
  auto records = repository_->ListReviewRecords(*tx, user_id);
  auto streak  = StreakFrom(*tx, user_id, today);
  tx->Commit();

  StatisticsOverview overview;
  double             ease_sum = 0;
  for (const auto& record : records) {
    const auto classification = scheduling::Classify(record, now);
    if (classification.status == recall::scheduler::v1::DUE_STATUS_DUE) {
      overview.set_due_today(overview.due_today() + 1);
      if (classification.days_overdue > 0) {
        overview.set_overdue(overview.overdue() + 1);
      }
    }
    if (record.last_reviewed_ms != 0 && calendar.DayOf(util::FromUnixMillis(record.last_reviewed_ms)) == today) {
      overview.set_completed_today(overview.completed_today() + 1);
    }
    if (record.next_review_ms < week_end) {
      overview.set_due_this_week(overview.due_this_week() + 1);
    }
    ease_sum += record.ease_factor;
  }

  overview.set_total_items(static_cast<uint32_t>(records.size()));
  overview.set_average_ease_factor(records.empty() ? 0.0 : ease_sum / static_cast<double>(records.size()));
  overview.set_learning_streak(streak);
  return overview;
}

std::vector<UpcomingDay> StatisticsAggregator::Upcoming(const std::string& user_id, uint32_t days, util::TimePoint now) {
  RequireUser(user_id);
  if (days < kMinUpcomingDays || days > kMaxUpcomingDays) {
    throw util::InvalidArgument("upcoming: days must be between 1 and 30, got " + std::to_string(days));
  }

  const uint64_t now_ms     = Ms(now);
  const uint64_t horizon_ms = Ms(now + std::chrono::days(days));

  auto tx      = repository_->Begin();
  auto records = repository_->ListReviewRecords(*tx, user_id);
  tx->Commit();

  std::erase_if(records, [&](const db::model::ReviewRecord& r) { return r.next_review_ms <= now_ms || r.next_review_ms > horizon_ms; });
  std::sort(records.begin(), records.end(), [](const db::model::ReviewRecord& a, const db::model::ReviewRecord& b) {
    if (a.next_review_ms != b.next_review_ms) return a.next_review_ms < b.next_review_ms;
    return a.id < b.id;
  });

  // records are sorted, so dates come out ascending
  std::vector<UpcomingDay> out;
  for (const auto& record : records) {
    const auto date = util::FormatDate(options_.calendar.DayOf(util::FromUnixMillis(record.next_review_ms)));
    if (out.empty() || out.back().date() != date) {
      out.emplace_back();
      out.back().set_date(date);
    }
    *out.back().add_records() = core::ToProto(record);
  }
  return out;
}

DailySummary StatisticsAggregator::BuildDaily(util::Day day, const std::vector<db::model::ReviewRecord>& records,
                                              const std::vector<db::model::ReviewEventRecord>& events) const {
  const auto&    calendar     = options_.calendar;
  const uint64_t day_start    = Ms(calendar.StartOf(day));
  const uint64_t day_end      = Ms(calendar.EndOf(day));
  const uint64_t tomorrow_end = Ms(calendar.EndOf(day + std::chrono::days(1)));

  uint32_t completed   = 0;
  uint32_t new_items   = 0;
  int64_t  quality_sum = 0;
  for (const auto& event : events) {
    if (event.reviewed_at_ms < day_start || event.reviewed_at_ms >= day_end) continue;
    ++completed;
    quality_sum += event.quality;
    if (event.first_review) ++new_items;
  }

  uint32_t due          = 0;
  uint32_t due_tomorrow = 0;
  for (const auto& record : records) {
    if (record.next_review_ms < day_end) {
      ++due;
    } else if (record.next_review_ms < tomorrow_end) {
      ++due_tomorrow;
    }
  }

  DailySummary summary;
  summary.set_date(util::FormatDate(day));
  summary.set_reviews_completed(completed);
  summary.set_reviews_due(due);
  summary.set_average_quality(completed == 0 ? 0.0 : static_cast<double>(quality_sum) / completed);
  summary.set_new_items_learned(new_items);
  summary.set_due_tomorrow(due_tomorrow);
  summary.set_completion_rate(static_cast<double>(completed) / std::max<uint32_t>(1, completed + due) * 100.0);
  return summary;
}

DailySummary StatisticsAggregator::Daily(const std::string& user_id, std::optional<util::Day> date, util::TimePoint now) {
  RequireUser(user_id);

  const auto& calendar = options_.calendar;
  const auto  day      = date.value_or(calendar.DayOf(now));

  auto tx      = repository_->Begin();
  auto records = repository_->ListReviewRecords(*tx, user_id);
  auto events  = repository_->ListReviewEvents(*tx, user_id, Ms(calendar.StartOf(day)), Ms(calendar.EndOf(day)));
  tx->Commit();

  return BuildDaily(day, records, events);
}

WeeklySummary StatisticsAggregator::Weekly(const std::string& user_id, std::optional<util::Day> week_start, util::TimePoint now) {
  RequireUser(user_id);

  const auto& calendar = options_.calendar;
  const auto  start    = week_start.value_or(MondayOf(calendar.DayOf(now)));
  const auto  end      = start + std::chrono::days(7);

  auto tx      = repository_->Begin();
  auto records = repository_->ListReviewRecords(*tx, user_id);
  auto events  = repository_->ListReviewEvents(*tx, user_id, Ms(calendar.StartOf(start)), Ms(calendar.StartOf(end)));
  tx->Commit();

  WeeklySummary weekly;
  weekly.set_week_start(util::FormatDate(start));

  uint32_t total       = 0;
  uint32_t active      = 0;
  int64_t  quality_sum = 0;
  for (auto day = start; day < end; day += std::chrono::days(1)) {
    auto daily = BuildDaily(day, records, events);
    total += daily.reviews_completed();
    if (daily.reviews_completed() > 0) ++active;
    *weekly.add_days() = std::move(daily);
  }
  for (const auto& event : events) {
    quality_sum += event.quality;
  }

  weekly.set_total_completed(total);
  weekly.set_days_active(active);
  weekly.set_average_daily_reviews(static_cast<double>(total) / 7.0);
  weekly.set_average_quality(events.empty() ? 0.0 : static_cast<double>(quality_sum) / static_cast<double>(events.size()));
  return weekly;
}

uint32_t StatisticsAggregator::LearningStreak(const std::string& user_id, util::TimePoint now) {
  RequireUser(user_id);

  auto tx     = repository_->Begin();
  auto streak = StreakFrom(*tx, user_id, options_.calendar.DayOf(now));
  tx->Commit();
  return streak;
}

std::vector<Achievement> StatisticsAggregator::AchievementsAfterCompletion(const std::string& user_id, util::TimePoint now) {
  RequireUser(user_id);

  const auto& calendar = options_.calendar;
  const auto  today    = calendar.DayOf(now);

  auto tx           = repository_->Begin();
  auto total        = repository_->CountReviewEvents(*tx, user_id);
  auto today_events = repository_->ListReviewEvents(*tx, user_id, Ms(calendar.StartOf(today)), Ms(calendar.EndOf(today)));
  auto streak       = StreakFrom(*tx, user_id, today);
  tx->Commit();

  std::vector<Achievement> out;
  if (total == 1) {
    out.push_back(MakeAchievement(recall::scheduler::v1::ACHIEVEMENT_TYPE_FIRST_REVIEW, 1, "First Review Complete!",
                                  "You completed your first spaced repetition review!"));
  }

  // the streak only grows with the first review of a day
  if (today_events.size() == 1 && IsMilestone(kStreakMilestones, streak)) {
    out.push_back(MakeAchievement(recall::scheduler::v1::ACHIEVEMENT_TYPE_STREAK_MILESTONE, streak, std::to_string(streak) + " Day Streak!",
                                  "Amazing! You've maintained a " + std::to_string(streak) + " day learning streak!"));
  }

  if (IsMilestone(kReviewMilestones, total)) {
    out.push_back(MakeAchievement(recall::scheduler::v1::ACHIEVEMENT_TYPE_REVIEW_MILESTONE, static_cast<uint32_t>(total),
                                  std::to_string(total) + " Reviews Complete!",
                                  "You've completed " + std::to_string(total) + " reviews! Keep up the great work!"));
  }
  return out;
}

} // namespace recall::stats
