#include "stats_service.hpp"

#include <optional>
#include <stdexcept>

#include "internal/stats/reminder_builder.hpp"
#include "internal/stats/statistics_aggregator.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace recall::service {

using namespace recall::scheduler::v1;

namespace {

constexpr uint32_t kDefaultUpcomingDays = 7;

std::optional<util::Day> OptionalDate(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  return util::ParseDate(text);
}

} // namespace

StatsService::StatsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.statistics || !ctx_.reminders) {
    throw std::invalid_argument("StatsService requires statistics and reminders");
  }
  if (!ctx_.clock) {
    ctx_.clock = util::Now;
  }
}

StatisticsOverview StatsService::GetOverview(const GetOverviewRequest& req) {
  return ObserveRpc("StatsService.GetOverview", req.user_id(), [&] {
    return ctx_.statistics->Overview(req.user_id(), ctx_.clock());
  });
}

GetUpcomingResponse StatsService::GetUpcoming(const GetUpcomingRequest& req) {
  return ObserveRpc("StatsService.GetUpcoming", req.user_id(), [&] {
    const auto days = req.days() == 0 ? kDefaultUpcomingDays : req.days();

    GetUpcomingResponse resp;
    for (auto& day : ctx_.statistics->Upcoming(req.user_id(), days, ctx_.clock())) {
      *resp.add_days() = std::move(day);
    }
    return resp;
  });
}

DailySummary StatsService::GetDailySummary(const GetDailySummaryRequest& req) {
  return ObserveRpc("StatsService.GetDailySummary", req.user_id(), [&] {
    return ctx_.statistics->Daily(req.user_id(), OptionalDate(req.date()), ctx_.clock());
  });
}

WeeklySummary StatsService::GetWeeklySummary(const GetWeeklySummaryRequest& req) {
  return ObserveRpc("StatsService.GetWeeklySummary", req.user_id(), [&] {
    return ctx_.statistics->Weekly(req.user_id(), OptionalDate(req.week_start()), ctx_.clock());
  });
}

GetRemindersResponse StatsService::GetReminders(const GetRemindersRequest& req) {
  return ObserveRpc("StatsService.GetReminders", req.user_id(), [&] {
    GetRemindersResponse resp;
    for (auto& reminder : ctx_.reminders->Build(req.user_id(), ctx_.clock())) {
      *resp.add_reminders() = std::move(reminder);
    }
    return resp;
  });
}

}
