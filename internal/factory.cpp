#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <google/protobuf/util/time_util.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/review_server.hpp"
#include "internal/grpc/stats_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if RECALL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RECALL_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace recall::factory {

using namespace recall;

namespace {

std::chrono::milliseconds DurationOr(bool set, const google::protobuf::Duration& value, std::chrono::milliseconds fallback) {
  if (!set) return fallback;
  return std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(value));
}

#if RECALL_DB_POSTGRES
constexpr std::size_t kDefaultPgConnections = 16;
#endif

} // namespace

core::ReviewScheduler::Options SchedulerOptionsFrom(const recall::runtime::config::SchedulerConfig& config) {
  core::ReviewScheduler::Options options;
  if (config.default_due_limit() != 0) options.default_due_limit = config.default_due_limit();
  if (config.max_due_limit() != 0) options.max_due_limit = config.max_due_limit();
  options.replay_window = DurationOr(config.has_replay_window(), config.replay_window(), options.replay_window);
  return options;
}

stats::StatisticsAggregator::Options StatisticsOptionsFrom(const recall::runtime::config::SchedulerConfig& config) {
  stats::StatisticsAggregator::Options options;
  options.calendar = util::CalendarDays(std::chrono::minutes(config.day_boundary_utc_offset_minutes()));
  if (config.streak_lookback_days() != 0) options.streak_lookback_days = config.streak_lookback_days();
  return options;
}

std::chrono::milliseconds DueSoonWindowFrom(const recall::runtime::config::SchedulerConfig& config) {
  return DurationOr(config.has_due_soon_window(), config.due_soon_window(), std::chrono::hours(2));
}

std::shared_ptr<db::Repository> BuildRepository(const recall::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RECALL_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->ApplySchema();
    RECALL_LOG_INFO("database ready", {observability::StringField("backend", "sqlite"),
                                       observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RECALL_DB_POSTGRES
    const auto max_connections =
        database.postgres().max_connections() != 0 ? database.postgres().max_connections() : kDefaultPgConnections;
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->ApplySchema();
    RECALL_LOG_INFO("database ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RECALL_LOG_WARN("using in-memory repository, review data will not survive restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const recall::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& scheduler_config = config.scheduler();

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.scheduler  = std::make_shared<core::ReviewScheduler>(app.repository, SchedulerOptionsFrom(scheduler_config));
  app.statistics = std::make_shared<stats::StatisticsAggregator>(app.repository, StatisticsOptionsFrom(scheduler_config));
  app.reminders  = std::make_shared<stats::ReminderBuilder>(app.repository, DueSoonWindowFrom(scheduler_config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.scheduler  = app.scheduler;
  ctx.statistics = app.statistics;
  ctx.reminders  = app.reminders;
  ctx.repository = app.repository;

  app.review_service = std::make_shared<service::ReviewService>(ctx);
  app.stats_service  = std::make_shared<service::StatsService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<recall::grpc::ReviewServer>(app.review_service));
  app.grpc_services.push_back(std::make_unique<recall::grpc::StatsServer>(app.stats_service));

  return app;
}

} // namespace recall::factory
