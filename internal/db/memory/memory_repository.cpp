#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace recall::db::memory {

MemoryRepository::MemoryRepository() = default;

std::string MemoryRepository::ContentKey(const std::string& user_id, const std::string& content_id, recall::scheduler::v1::ContentType content_type) {
  return user_id + "#" + std::to_string(static_cast<int>(content_type)) + "#" + content_id;
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertReviewRecord(Transaction& t, const model::ReviewRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = ContentKey(r.user_id, r.content_id, r.content_type);
  if (s.records.contains(r.id) || s.content_index.contains(key)) return Result::Err(ErrorCode::AlreadyExists);

  TX(t).Touch(r.id);
  s.records[r.id]       = r;
  s.content_index[key] = r.id;
  return Result::Ok();
}

std::optional<model::ReviewRecord> MemoryRepository::GetReviewRecord(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.records.find(id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ReviewRecord> MemoryRepository::FindReviewRecordByContent(Transaction& t, const std::string& user_id, const std::string& content_id,
                                                                              recall::scheduler::v1::ContentType content_type) {
  const auto& s  = TX(t).View();
  const auto  it = s.content_index.find(ContentKey(user_id, content_id, content_type));
  if (it == s.content_index.end()) return std::nullopt;
  return GetReviewRecord(t, it->second);
}

std::vector<model::ReviewRecord> MemoryRepository::ListReviewRecords(Transaction& t, const std::string& user_id) {
  std::vector<model::ReviewRecord> out;
  for (const auto& [_, record] : TX(t).View().records)
    if (record.user_id == user_id) out.push_back(record);
  return out;
}

std::vector<model::ReviewRecord> MemoryRepository::ListDueReviewRecords(Transaction& t, const std::string& user_id, uint64_t now_ms) {
  std::vector<model::ReviewRecord> out;
  for (const auto& [_, record] : TX(t).View().records)
    if (record.user_id == user_id && record.next_review_ms <= now_ms) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdateReviewRecord(Transaction& t, const model::ReviewRecord& r, uint64_t expected_version) {
  auto&      s  = TX(t).Mutable();
  const auto it = s.records.find(r.id);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "version " + std::to_string(it->second.version) + " != expected " + std::to_string(expected_version));
  }

  TX(t).Touch(r.id);
  s.content_index.erase(ContentKey(it->second.user_id, it->second.content_id, it->second.content_type));
  it->second = r;
  s.content_index[ContentKey(r.user_id, r.content_id, r.content_type)] = r.id;
  return Result::Ok();
}

Result MemoryRepository::DeleteReviewRecord(Transaction& t, const std::string& id) {
  auto&      s  = TX(t).Mutable();
  const auto it = s.records.find(id);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound);

  TX(t).Touch(id);
  s.content_index.erase(ContentKey(it->second.user_id, it->second.content_id, it->second.content_type));
  s.records.erase(it);
  s.events.erase(id);
  return Result::Ok();
}

Result MemoryRepository::AppendReviewEvent(Transaction& t, const model::ReviewEventRecord& e) {
  auto& s = TX(t).Mutable();
  if (!s.records.contains(e.record_id)) return Result::Err(ErrorCode::NotFound);

  s.events[e.record_id].push_back(e);
  TX(t).RecordAppendedEvent(e);
  return Result::Ok();
}

std::vector<model::ReviewEventRecord> MemoryRepository::ListReviewEvents(Transaction& t, const std::string& user_id, uint64_t from_ms, uint64_t to_ms) {
  std::vector<model::ReviewEventRecord> out;
  for (const auto& [_, events] : TX(t).View().events) {
    for (const auto& e : events) {
      if (e.user_id == user_id && e.reviewed_at_ms >= from_ms && e.reviewed_at_ms < to_ms) out.push_back(e);
    }
  }

  std::sort(out.begin(), out.end(), [](const model::ReviewEventRecord& a, const model::ReviewEventRecord& b) {
    if (a.reviewed_at_ms != b.reviewed_at_ms) return a.reviewed_at_ms < b.reviewed_at_ms;
    return a.id < b.id;
  });
  return out;
}

std::optional<model::ReviewEventRecord> MemoryRepository::GetLatestReviewEvent(Transaction& t, const std::string& record_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.events.find(record_id);
  if (it == s.events.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

uint64_t MemoryRepository::CountReviewEvents(Transaction& t, const std::string& user_id) {
  uint64_t count = 0;
  for (const auto& [_, events] : TX(t).View().events)
    for (const auto& e : events)
      if (e.user_id == user_id) ++count;
  return count;
}

} // namespace recall::db::memory
