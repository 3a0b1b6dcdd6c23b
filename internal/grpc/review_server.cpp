#include "review_server.hpp"
#include "grpc_error.hpp"

namespace recall::grpc {

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

ReviewServer::ReviewServer(std::shared_ptr<recall::service::ReviewService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ReviewServer::ScheduleItem(::grpc::ServerContext*,
                                          const recall::scheduler::v1::ScheduleItemRequest* req,
                                          recall::scheduler::v1::ScheduleItemResponse* resp) {
  return Invoke([&] { *resp = service_->ScheduleItem(*req); });
}

::grpc::Status ReviewServer::ListDue(::grpc::ServerContext*,
                                     const recall::scheduler::v1::ListDueRequest* req,
                                     recall::scheduler::v1::ListDueResponse* resp) {
  return Invoke([&] { *resp = service_->ListDue(*req); });
}

::grpc::Status ReviewServer::CompleteReview(::grpc::ServerContext*,
                                            const recall::scheduler::v1::CompleteReviewRequest* req,
                                            recall::scheduler::v1::CompleteReviewResponse* resp) {
  return Invoke([&] { *resp = service_->CompleteReview(*req); });
}

::grpc::Status ReviewServer::DeleteRecord(::grpc::ServerContext*,
                                          const recall::scheduler::v1::DeleteRecordRequest* req,
                                          recall::scheduler::v1::DeleteRecordResponse* resp) {
  return Invoke([&] { *resp = service_->DeleteRecord(*req); });
}

::grpc::Status ReviewServer::GetRecord(::grpc::ServerContext*,
                                       const recall::scheduler::v1::GetRecordRequest* req,
                                       recall::scheduler::v1::GetRecordResponse* resp) {
  return Invoke([&] { *resp = service_->GetRecord(*req); });
}

}
