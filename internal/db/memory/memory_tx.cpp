#include "memory_tx.hpp"

#include <mutex>

namespace recall::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Touch(const std::string& record_id) {
  if (base_versions_.contains(record_id)) return;

  const auto it = working_.records.find(record_id);
  base_versions_.emplace(record_id, it == working_.records.end() ? 0 : it->second.version);
}

void MemoryTransaction::RecordAppendedEvent(const model::ReviewEventRecord& event) {
  appended_events_.push_back(event);
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  auto&            target = repo_.committed_;

  // validate the whole write set before touching committed state
  for (const auto& [id, base_version] : base_versions_) {
    const auto     it      = target.records.find(id);
    const uint64_t current = it == target.records.end() ? 0 : it->second.version;
    if (current != base_version) {
      rolled_back_ = true;
      throw CommitError(ErrorCode::Conflict, "transaction conflict: review record " + id + " was modified by a concurrent transaction");
    }

    const auto written = working_.records.find(id);
    if (base_version == 0 && written != working_.records.end()) {
      const auto key = MemoryRepository::ContentKey(written->second.user_id, written->second.content_id, written->second.content_type);
      if (target.content_index.contains(key)) {
        rolled_back_ = true;
        throw CommitError(ErrorCode::AlreadyExists, "transaction conflict: content already scheduled by a concurrent transaction");
      }
    }
  }

  for (const auto& [id, base_version] : base_versions_) {
    const auto existing = target.records.find(id);
    if (existing != target.records.end()) {
      target.content_index.erase(MemoryRepository::ContentKey(existing->second.user_id, existing->second.content_id, existing->second.content_type));
    }

    const auto written = working_.records.find(id);
    if (written == working_.records.end()) {
      target.records.erase(id);
      target.events.erase(id);
      continue;
    }

    target.records[id] = written->second;
    target.content_index[MemoryRepository::ContentKey(written->second.user_id, written->second.content_id, written->second.content_type)] = id;
  }

  for (auto& event : appended_events_) {
    if (!target.records.contains(event.record_id)) continue;
    target.events[event.record_id].push_back(std::move(event));
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  base_versions_.clear();
  appended_events_.clear();
  rolled_back_ = true;
}

} // namespace recall::db::memory
