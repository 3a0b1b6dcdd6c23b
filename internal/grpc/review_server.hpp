#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/review_service.hpp"
#include "recall/scheduler/v1_grpc.hpp"

namespace recall::grpc {

class ReviewServer final : public recall::scheduler::v1::ReviewService::Service {
public:
  explicit ReviewServer(std::shared_ptr<recall::service::ReviewService> svc);

  ::grpc::Status ScheduleItem(::grpc::ServerContext*,
                              const recall::scheduler::v1::ScheduleItemRequest*,
                              recall::scheduler::v1::ScheduleItemResponse*) override;

  ::grpc::Status ListDue(::grpc::ServerContext*,
                         const recall::scheduler::v1::ListDueRequest*,
                         recall::scheduler::v1::ListDueResponse*) override;

  ::grpc::Status CompleteReview(::grpc::ServerContext*,
                                const recall::scheduler::v1::CompleteReviewRequest*,
                                recall::scheduler::v1::CompleteReviewResponse*) override;

  ::grpc::Status DeleteRecord(::grpc::ServerContext*,
                              const recall::scheduler::v1::DeleteRecordRequest*,
                              recall::scheduler::v1::DeleteRecordResponse*) override;

  ::grpc::Status GetRecord(::grpc::ServerContext*,
                           const recall::scheduler::v1::GetRecordRequest*,
                           recall::scheduler::v1::GetRecordResponse*) override;

private:
  std::shared_ptr<recall::service::ReviewService> service_;
};

}
