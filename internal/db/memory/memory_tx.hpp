#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace recall::db::memory {

/*
  Transaction = snapshot + write set

  Commit replays the write set onto the committed state after checking
  that every written record still has the version this transaction saw.
  Writes to different records never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  // Must be called before the first write to a record; remembers the
  // version seen in the snapshot (0 = absent).
  void Touch(const std::string& record_id);
  void RecordAppendedEvent(const model::ReviewEventRecord& event);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  std::unordered_map<std::string, uint64_t> base_versions_;
  std::vector<model::ReviewEventRecord>     appended_events_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace recall::db::memory
