#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/stats_service.hpp"
#include "recall/scheduler/v1_grpc.hpp"

namespace recall::grpc {

class StatsServer final : public recall::scheduler::v1::StatsService::Service {
public:
  explicit StatsServer(std::shared_ptr<recall::service::StatsService> svc);

  ::grpc::Status GetOverview(::grpc::ServerContext*,
                             const recall::scheduler::v1::GetOverviewRequest*,
                             recall::scheduler::v1::StatisticsOverview*) override;

  ::grpc::Status GetUpcoming(::grpc::ServerContext*,
                             const recall::scheduler::v1::GetUpcomingRequest*,
                             recall::scheduler::v1::GetUpcomingResponse*) override;

  ::grpc::Status GetDailySummary(::grpc::ServerContext*,
                                 const recall::scheduler::v1::GetDailySummaryRequest*,
                                 recall::scheduler::v1::DailySummary*) override;

  ::grpc::Status GetWeeklySummary(::grpc::ServerContext*,
                                  const recall::scheduler::v1::GetWeeklySummaryRequest*,
                                  recall::scheduler::v1::WeeklySummary*) override;

  ::grpc::Status GetReminders(::grpc::ServerContext*,
                              const recall::scheduler::v1::GetRemindersRequest*,
                              recall::scheduler::v1::GetRemindersResponse*) override;

private:
  std::shared_ptr<recall::service::StatsService> service_;
};

}
