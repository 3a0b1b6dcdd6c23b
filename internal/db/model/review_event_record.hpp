#pragma once

#include <cstdint>
#include <string>

namespace recall::db::model {

// Append-only log row, written in the same transaction as the record update.
struct ReviewEventRecord {
  std::string id;
  std::string record_id;
  std::string user_id;
  int32_t     quality        = 0;
  uint64_t    reviewed_at_ms = 0;
  uint32_t    interval_days  = 0; // after the review
  double      ease_factor    = 0; // after the review
  bool        first_review   = false;
};

}
