#include "sm2.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace recall::scheduling {

void ValidateQuality(int quality) {
  if (quality < kMinQuality || quality > kMaxQuality) {
    throw util::InvalidQuality("quality must be between 0 and 5, got " + std::to_string(quality));
  }
}

double EaseDelta(int quality) {
  const double miss = static_cast<double>(kMaxQuality - quality);
  return 0.1 - miss * (0.08 + miss * 0.02);
}

uint32_t NextIntervalDays(uint32_t review_count, uint32_t interval_days, double new_ease_factor, int quality) {
  if (quality < kPassingQuality) {
    return 1;
  }

  if (review_count == 0) return 1;
  if (review_count == 1) return 6;

  const double grown = std::round(static_cast<double>(interval_days) * new_ease_factor);
  if (!(grown < static_cast<double>(kMaxIntervalDays))) {
    return kMaxIntervalDays;
  }
  return static_cast<uint32_t>(std::max(1.0, grown));
}

db::model::ReviewRecord ApplyReview(const db::model::ReviewRecord& record, int quality, util::TimePoint now) {
  ValidateQuality(quality);

  db::model::ReviewRecord next = record;

  next.ease_factor   = std::max(kMinEaseFactor, record.ease_factor + EaseDelta(quality));
  next.interval_days = NextIntervalDays(record.review_count, record.interval_days, next.ease_factor, quality);
  next.review_count  = record.review_count + 1;

  const uint64_t now_ms = util::ToUnixMillis(now);
  next.last_reviewed_ms = now_ms;
  next.next_review_ms   = util::AddDaysSaturated(now_ms, next.interval_days);
  next.updated_at_ms    = now_ms;
  next.version          = record.version + 1;

  return next;
}

} // namespace recall::scheduling
