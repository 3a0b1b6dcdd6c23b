#pragma once

#include "recall/scheduler/v1.hpp"

#include "recall/scheduler/v1/review_service.grpc.pb.h"
#include "recall/scheduler/v1/stats_service.grpc.pb.h"
