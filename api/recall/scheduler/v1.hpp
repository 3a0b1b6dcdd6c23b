#pragma once

#include "recall/scheduler/v1/types.pb.h"

#include "recall/scheduler/v1/review_service.pb.h"
#include "recall/scheduler/v1/stats_service.pb.h"
