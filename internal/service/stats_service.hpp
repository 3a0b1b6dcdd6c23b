#pragma once

#include "recall/scheduler/v1.hpp"
#include "service_context.hpp"

namespace recall::service {

class StatsService {
public:
  explicit StatsService(ServiceContext ctx);

  recall::scheduler::v1::StatisticsOverview
  GetOverview(const recall::scheduler::v1::GetOverviewRequest& req);

  recall::scheduler::v1::GetUpcomingResponse
  GetUpcoming(const recall::scheduler::v1::GetUpcomingRequest& req);

  recall::scheduler::v1::DailySummary
  GetDailySummary(const recall::scheduler::v1::GetDailySummaryRequest& req);

  recall::scheduler::v1::WeeklySummary
  GetWeeklySummary(const recall::scheduler::v1::GetWeeklySummaryRequest& req);

  recall::scheduler::v1::GetRemindersResponse
  GetReminders(const recall::scheduler::v1::GetRemindersRequest& req);

private:
  ServiceContext ctx_;
};

}
