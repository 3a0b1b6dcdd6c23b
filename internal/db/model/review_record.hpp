#pragma once

#include <cstdint>
#include <string>

#include "recall/scheduler/v1/types.pb.h"

namespace recall::db::model {

/*
  Persistent review state, one row per (user_id, content_id, content_type).

  IMPORTANT:
  - ease_factor never drops below 1.3.
  - interval_days is 0 until the first review.
  - version starts at 1 and is bumped by every update; updates are
    compare-and-swap on it.
*/

struct ReviewRecord {
  std::string id; // UUID
  std::string user_id;
  std::string content_id;

  recall::scheduler::v1::ContentType content_type = recall::scheduler::v1::CONTENT_TYPE_UNSPECIFIED;

  uint32_t review_count  = 0;
  double   ease_factor   = 2.5;
  uint32_t interval_days = 0;

  // epoch ms; last_reviewed_ms == 0 means never reviewed
  uint64_t last_reviewed_ms = 0;
  uint64_t next_review_ms   = 0;
  uint64_t created_at_ms    = 0;
  uint64_t updated_at_ms    = 0;

  uint64_t version = 0;
};

}
