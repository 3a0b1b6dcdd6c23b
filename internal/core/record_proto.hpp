#pragma once

#include "internal/db/model/review_record.hpp"
#include "internal/scheduling/due_classifier.hpp"
#include "recall/scheduler/v1/types.pb.h"

namespace recall::core {

// Storage row -> wire message. last_reviewed stays unset for never-reviewed records.
recall::scheduler::v1::ReviewRecord ToProto(const db::model::ReviewRecord& record);

recall::scheduler::v1::DueItem ToDueItem(const db::model::ReviewRecord& record, const scheduling::DueClassification& classification);

} // namespace recall::core
