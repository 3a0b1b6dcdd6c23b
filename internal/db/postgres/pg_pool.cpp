#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace recall::db::postgres {

namespace {

constexpr const char* kRecordColumns =
    "id,user_id,content_id,content_type,review_count,ease_factor,interval_days,last_reviewed_ms,next_review_ms,created_at_ms,updated_at_ms,version";

// arbitrary, shared by every recall-scheduler process on the database
constexpr long long kSchemaLockKey = 0x7265'6361'6c6cLL;

constexpr const char* kEventColumns = "id,record_id,user_id,quality,reviewed_at_ms,interval_days,ease_factor,first_review";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) {
          return Wrap(conn.release());
        }
        // broken connection: drop it and open a fresh one below
        --live_connections_;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::ApplySchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  tx.exec("SELECT pg_advisory_xact_lock(" + std::to_string(kSchemaLockKey) + ")");
  for (const auto& statement : sql::PostgresSchema()) {
    tx.exec(statement);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string records = kRecordColumns;
  const std::string events  = kEventColumns;

  conn.prepare("insert_review_record", "INSERT INTO review_record(" + records + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");
  conn.prepare("get_review_record", "SELECT " + records + " FROM review_record WHERE id=$1");
  conn.prepare("find_review_record_by_content",
               "SELECT " + records + " FROM review_record WHERE user_id=$1 AND content_id=$2 AND content_type=$3");
  conn.prepare("list_review_records", "SELECT " + records + " FROM review_record WHERE user_id=$1");
  conn.prepare("list_due_review_records", "SELECT " + records + " FROM review_record WHERE user_id=$1 AND next_review_ms<=$2");
  conn.prepare("update_review_record",
               "UPDATE review_record SET review_count=$2,ease_factor=$3,interval_days=$4,last_reviewed_ms=$5,next_review_ms=$6,"
               "updated_at_ms=$7,version=$8 WHERE id=$1 AND version=$9");
  conn.prepare("review_record_exists", "SELECT 1 FROM review_record WHERE id=$1");
  conn.prepare("delete_review_events_for_record", "DELETE FROM review_event WHERE record_id=$1");
  conn.prepare("delete_review_record", "DELETE FROM review_record WHERE id=$1");

  conn.prepare("insert_review_event", "INSERT INTO review_event(" + events + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  conn.prepare("list_review_events",
               "SELECT " + events + " FROM review_event WHERE user_id=$1 AND reviewed_at_ms>=$2 AND reviewed_at_ms<$3 "
               "ORDER BY reviewed_at_ms ASC, id ASC");
  conn.prepare("latest_review_event", "SELECT " + events + " FROM review_event WHERE record_id=$1 ORDER BY seq DESC LIMIT 1");
  conn.prepare("count_review_events", "SELECT COUNT(*) FROM review_event WHERE user_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace recall::db::postgres
