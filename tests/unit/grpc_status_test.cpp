#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/review_scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/review_server.hpp"
#include "internal/grpc/stats_server.hpp"
#include "internal/service/review_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/stats_service.hpp"
#include "internal/stats/reminder_builder.hpp"
#include "internal/stats/statistics_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "recall/scheduler/v1.hpp"

namespace {

using namespace recall::scheduler::v1;

recall::service::ServiceContext BuildServiceContext() {
  recall::service::ServiceContext ctx;
  auto repository = std::make_shared<recall::db::memory::MemoryRepository>();
  ctx.repository  = repository;
  ctx.scheduler   = std::make_shared<recall::core::ReviewScheduler>(repository);
  ctx.statistics  = std::make_shared<recall::stats::StatisticsAggregator>(repository);
  ctx.reminders   = std::make_shared<recall::stats::ReminderBuilder>(repository);
  return ctx;
}

std::string ScheduleOne(recall::grpc::ReviewServer& server, const std::string& user) {
  ScheduleItemRequest req;
  req.set_user_id(user);
  req.set_content_id("q-1");
  req.set_content_type(CONTENT_TYPE_QUESTION);
  ScheduleItemResponse  resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ScheduleItem(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return resp.record().id();
}

void TestErrorMapping() {
  using recall::grpc::ToStatus;
  assert(ToStatus(recall::util::InvalidQuality("q")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(recall::util::InvalidArgument("a")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(recall::util::NotFound("n")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(recall::util::Forbidden("f")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(recall::util::Conflict("c")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(recall::util::AlreadyExists("e")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(recall::util::NotFound("record r1 not found")).error_message() == "record r1 not found");
}

void TestCompleteMissingRecordReturnsNotFound() {
  auto ctx = BuildServiceContext();
  recall::grpc::ReviewServer server(std::make_shared<recall::service::ReviewService>(ctx));

  CompleteReviewRequest req;
  req.set_user_id("alice");
  req.set_record_id("missing-record");
  req.set_quality(4);
  CompleteReviewResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.CompleteReview(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestQualityOutOfRangeReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  recall::grpc::ReviewServer server(std::make_shared<recall::service::ReviewService>(ctx));
  const auto id = ScheduleOne(server, "alice");

  CompleteReviewRequest req;
  req.set_user_id("alice");
  req.set_record_id(id);
  req.set_quality(6);
  CompleteReviewResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.CompleteReview(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestOtherUsersRecordReturnsPermissionDenied() {
  auto ctx = BuildServiceContext();
  recall::grpc::ReviewServer server(std::make_shared<recall::service::ReviewService>(ctx));
  const auto id = ScheduleOne(server, "alice");

  GetRecordRequest req;
  req.set_user_id("mallory");
  req.set_record_id(id);
  GetRecordResponse     resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetRecord(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestStaleVersionReturnsAborted() {
  auto ctx = BuildServiceContext();
  recall::grpc::ReviewServer server(std::make_shared<recall::service::ReviewService>(ctx));
  const auto id = ScheduleOne(server, "alice");

  CompleteReviewRequest req;
  req.set_user_id("alice");
  req.set_record_id(id);
  req.set_quality(4);
  req.set_expected_version(42);
  CompleteReviewResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.CompleteReview(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
}

void TestStatsServerValidatesArguments() {
  auto ctx = BuildServiceContext();
  recall::grpc::StatsServer server(std::make_shared<recall::service::StatsService>(ctx));

  GetUpcomingRequest req;
  req.set_user_id("alice");
  req.set_days(90);
  GetUpcomingResponse   resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.GetUpcoming(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  GetOverviewRequest    overview_req;
  StatisticsOverview    overview;
  ::grpc::ServerContext overview_ctx;
  assert(server.GetOverview(&overview_ctx, &overview_req, &overview).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  overview_req.set_user_id("alice");
  ::grpc::ServerContext ok_ctx;
  assert(server.GetOverview(&ok_ctx, &overview_req, &overview).ok());
}

} // namespace

int main() {
  TestErrorMapping();
  TestCompleteMissingRecordReturnsNotFound();
  TestQualityOutOfRangeReturnsInvalidArgument();
  TestOtherUsersRecordReturnsPermissionDenied();
  TestStaleVersionReturnsAborted();
  TestStatsServerValidatesArguments();

  std::cout << "recall_unit_grpc_status: pass\n";
  return 0;
}
