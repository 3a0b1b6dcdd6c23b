#include "stats_server.hpp"
#include "grpc_error.hpp"

namespace recall::grpc {

StatsServer::StatsServer(std::shared_ptr<recall::service::StatsService> svc)
    : service_(std::move(svc)) {}

::grpc::Status StatsServer::GetOverview(::grpc::ServerContext*,
                                        const recall::scheduler::v1::GetOverviewRequest* req,
                                        recall::scheduler::v1::StatisticsOverview* resp) {
  try {
    *resp = service_->GetOverview(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatsServer::GetUpcoming(::grpc::ServerContext*,
                                        const recall::scheduler::v1::GetUpcomingRequest* req,
                                        recall::scheduler::v1::GetUpcomingResponse* resp) {
  try {
    *resp = service_->GetUpcoming(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatsServer::GetDailySummary(::grpc::ServerContext*,
                                            const recall::scheduler::v1::GetDailySummaryRequest* req,
                                            recall::scheduler::v1::DailySummary* resp) {
  try {
    *resp = service_->GetDailySummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatsServer::GetWeeklySummary(::grpc::ServerContext*,
                                             const recall::scheduler::v1::GetWeeklySummaryRequest* req,
                                             recall::scheduler::v1::WeeklySummary* resp) {
  try {
    *resp = service_->GetWeeklySummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatsServer::GetReminders(::grpc::ServerContext*,
                                         const recall::scheduler::v1::GetRemindersRequest* req,
                                         recall::scheduler::v1::GetRemindersResponse* resp) {
  try {
    *resp = service_->GetReminders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
