#include "record_proto.hpp"

#include "internal/util/time.hpp"

namespace recall::core {

recall::scheduler::v1::ReviewRecord ToProto(const db::model::ReviewRecord& record) {
  recall::scheduler::v1::ReviewRecord out;
  out.set_id(record.id);
  out.set_user_id(record.user_id);
  out.set_content_id(record.content_id);
  out.set_content_type(record.content_type);
  out.set_review_count(record.review_count);
  out.set_ease_factor(record.ease_factor);
  out.set_interval_days(record.interval_days);
  if (record.last_reviewed_ms != 0) {
    *out.mutable_last_reviewed() = util::ToProto(util::FromUnixMillis(record.last_reviewed_ms));
  }
  *out.mutable_next_review() = util::ToProto(util::FromUnixMillis(record.next_review_ms));
  *out.mutable_created_at()  = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  *out.mutable_updated_at()  = util::ToProto(util::FromUnixMillis(record.updated_at_ms));
  out.set_version(record.version);
  return out;
}

recall::scheduler::v1::DueItem ToDueItem(const db::model::ReviewRecord& record, const scheduling::DueClassification& classification) {
  recall::scheduler::v1::DueItem item;
  *item.mutable_record() = ToProto(record);
  item.set_status(classification.status);
  item.set_days_overdue(classification.days_overdue);
  item.set_days_until(classification.days_until);
  return item;
}

} // namespace recall::core
