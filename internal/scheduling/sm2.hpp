#pragma once

#include <cstdint>

#include "internal/db/model/review_record.hpp"
#include "internal/util/time.hpp"

namespace recall::scheduling {

/*
  SM-2 update engine.

  Pure: the caller supplies "now" and persists the result. Ownership and
  version checks happen in ReviewScheduler before ApplyReview runs.
*/

inline constexpr int    kMinQuality        = 0;
inline constexpr int    kMaxQuality        = 5;
inline constexpr int    kPassingQuality    = 3;
inline constexpr double kInitialEaseFactor = 2.5;
inline constexpr double kMinEaseFactor     = 1.3;

// A hundred years; keeps next_review inside the representable clock range.
inline constexpr uint32_t kMaxIntervalDays = 36500;

// Throws util::InvalidQuality outside [0,5].
void ValidateQuality(int quality);

// 0.1 - (5-q) * (0.08 + (5-q) * 0.02)
double EaseDelta(int quality);

// Interval after a review, given the state before it and the new ease factor.
// Always within [1, kMaxIntervalDays].
uint32_t NextIntervalDays(uint32_t review_count, uint32_t interval_days, double new_ease_factor, int quality);

// Returns the record after a review of the given quality at "now".
// review_count, version, last_reviewed, next_review and updated_at advance.
db::model::ReviewRecord ApplyReview(const db::model::ReviewRecord& record, int quality, util::TimePoint now);

} // namespace recall::scheduling
