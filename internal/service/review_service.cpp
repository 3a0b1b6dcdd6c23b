#include "review_service.hpp"

#include <optional>
#include <stdexcept>

#include "internal/core/record_proto.hpp"
#include "internal/core/review_scheduler.hpp"
#include "internal/scheduling/due_classifier.hpp"
#include "internal/stats/statistics_aggregator.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace recall::service {

using namespace recall::scheduler::v1;

ReviewService::ReviewService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.scheduler) {
    throw std::invalid_argument("ReviewService requires a scheduler");
  }
  if (!ctx_.clock) {
    ctx_.clock = util::Now;
  }
}

ScheduleItemResponse ReviewService::ScheduleItem(const ScheduleItemRequest& req) {
  return ObserveRpc("ReviewService.ScheduleItem", req.user_id(), [&] {
    const auto result = ctx_.scheduler->Schedule(req.user_id(), req.content_id(), req.content_type(), ctx_.clock());

    ScheduleItemResponse resp;
    *resp.mutable_record() = core::ToProto(result.record);
    resp.set_created(result.created);
    return resp;
  });
}

ListDueResponse ReviewService::ListDue(const ListDueRequest& req) {
  return ObserveRpc("ReviewService.ListDue", req.user_id(), [&] {
    const auto entries = ctx_.scheduler->ListDue(req.user_id(), req.limit(), ctx_.clock());

    ListDueResponse resp;
    for (const auto& entry : entries) {
      *resp.add_items() = core::ToDueItem(entry.record, entry.classification);
    }
    return resp;
  });
}

CompleteReviewResponse ReviewService::CompleteReview(const CompleteReviewRequest& req) {
  return ObserveRpc("ReviewService.CompleteReview", req.user_id(), [&] {
    const auto now              = ctx_.clock();
    const auto expected_version = req.expected_version() == 0 ? std::nullopt : std::optional<uint64_t>(req.expected_version());
    const auto result = ctx_.scheduler->CompleteReview(req.user_id(), req.record_id(), req.quality(), now, expected_version);

    CompleteReviewResponse resp;
    *resp.mutable_record()      = core::ToProto(result.record);
    *resp.mutable_next_review() = resp.record().next_review();
    resp.set_replayed(result.replayed);

    // the review is committed at this point; achievements are best effort
    if (!result.replayed && ctx_.statistics) {
      try {
        for (auto& achievement : ctx_.statistics->AchievementsAfterCompletion(req.user_id(), now)) {
          *resp.add_achievements() = std::move(achievement);
        }
      } catch (const std::exception& e) {
        RECALL_LOG_WARN("Achievement evaluation failed",
                        {observability::StringField("record_id", req.record_id()), observability::StringField("error", e.what())});
      }
    }
    return resp;
  });
}

DeleteRecordResponse ReviewService::DeleteRecord(const DeleteRecordRequest& req) {
  return ObserveRpc("ReviewService.DeleteRecord", req.user_id(), [&] {
    ctx_.scheduler->Delete(req.user_id(), req.record_id());

    DeleteRecordResponse resp;
    resp.set_record_id(req.record_id());
    return resp;
  });
}

GetRecordResponse ReviewService::GetRecord(const GetRecordRequest& req) {
  return ObserveRpc("ReviewService.GetRecord", req.user_id(), [&] {
    const auto now    = ctx_.clock();
    const auto record = ctx_.scheduler->Get(req.user_id(), req.record_id());

    GetRecordResponse resp;
    *resp.mutable_record()         = core::ToProto(record);
    *resp.mutable_classification() = core::ToDueItem(record, scheduling::Classify(record, now));
    return resp;
  });
}

}
