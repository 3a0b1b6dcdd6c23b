#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace recall::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  InvalidQuality / InvalidArgument -> INVALID_ARGUMENT
  NotFound                         -> NOT_FOUND
  Forbidden                        -> PERMISSION_DENIED
  Conflict                         -> ABORTED
  AlreadyExists                    -> ALREADY_EXISTS
  anything else                    -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace recall::grpc
