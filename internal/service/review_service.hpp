#pragma once

#include "recall/scheduler/v1.hpp"
#include "service_context.hpp"

namespace recall::service {

class ReviewService {
public:
  explicit ReviewService(ServiceContext ctx);

  recall::scheduler::v1::ScheduleItemResponse
  ScheduleItem(const recall::scheduler::v1::ScheduleItemRequest& req);

  recall::scheduler::v1::ListDueResponse
  ListDue(const recall::scheduler::v1::ListDueRequest& req);

  recall::scheduler::v1::CompleteReviewResponse
  CompleteReview(const recall::scheduler::v1::CompleteReviewRequest& req);

  recall::scheduler::v1::DeleteRecordResponse
  DeleteRecord(const recall::scheduler::v1::DeleteRecordRequest& req);

  recall::scheduler::v1::GetRecordResponse
  GetRecord(const recall::scheduler::v1::GetRecordRequest& req);

private:
  ServiceContext ctx_;
};

}
