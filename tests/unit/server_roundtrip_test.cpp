#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "recall/scheduler/v1_grpc.hpp"

namespace {

using namespace recall::scheduler::v1;

std::unique_ptr<recall::runtime::Server> StartServer() {
  recall::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  auto app    = recall::factory::Build(config);
  auto server = std::make_unique<recall::runtime::Server>("127.0.0.1:0", std::move(app.grpc_services));
  server->Start();
  assert(server->Port() > 0);
  return server;
}

void TestScheduleCompleteAndOverviewOverChannel() {
  auto server  = StartServer();
  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->Port()), ::grpc::InsecureChannelCredentials());

  auto reviews = ReviewService::NewStub(channel);
  auto stats   = StatsService::NewStub(channel);

  ScheduleItemRequest schedule;
  schedule.set_user_id("alice");
  schedule.set_content_id("kp-7");
  schedule.set_content_type(CONTENT_TYPE_KNOWLEDGE_POINT);

  ScheduleItemResponse scheduled;
  {
    ::grpc::ClientContext ctx;
    assert(reviews->ScheduleItem(&ctx, schedule, &scheduled).ok());
  }
  assert(scheduled.created());
  assert(scheduled.record().interval_days() == 0);

  // scheduling again returns the same record
  {
    ScheduleItemResponse again;
    ::grpc::ClientContext ctx;
    assert(reviews->ScheduleItem(&ctx, schedule, &again).ok());
    assert(!again.created());
    assert(again.record().id() == scheduled.record().id());
  }

  {
    ListDueRequest  req;
    ListDueResponse resp;
    req.set_user_id("alice");
    ::grpc::ClientContext ctx;
    assert(reviews->ListDue(&ctx, req, &resp).ok());
    assert(resp.items_size() == 1);
  }

  {
    CompleteReviewRequest req;
    req.set_user_id("alice");
    req.set_record_id(scheduled.record().id());
    req.set_quality(4);
    CompleteReviewResponse resp;
    ::grpc::ClientContext  ctx;
    assert(reviews->CompleteReview(&ctx, req, &resp).ok());
    assert(resp.record().interval_days() == 1);
    assert(resp.record().review_count() == 1);
    assert(!resp.replayed());
  }

  {
    CompleteReviewRequest req;
    req.set_user_id("bob");
    req.set_record_id(scheduled.record().id());
    req.set_quality(5);
    CompleteReviewResponse resp;
    ::grpc::ClientContext  ctx;
    assert(reviews->CompleteReview(&ctx, req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }

  {
    GetOverviewRequest req;
    req.set_user_id("alice");
    StatisticsOverview    resp;
    ::grpc::ClientContext ctx;
    assert(stats->GetOverview(&ctx, req, &resp).ok());
    assert(resp.total_items() == 1);
    assert(resp.completed_today() == 1);
    assert(resp.due_today() == 0);
    assert(resp.learning_streak() == 1);
  }

  server->Stop();
}

void TestStartFailsOnUnusableAddress() {
  recall::runtime::Server server("not-an-address:-1", {});
  bool                    threw = false;
  try {
    server.Start();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScheduleCompleteAndOverviewOverChannel();
  TestStartFailsOnUnusableAddress();

  std::cout << "recall_unit_server_roundtrip: pass\n";
  return 0;
}
