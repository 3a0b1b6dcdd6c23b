#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"

namespace {

using namespace std::chrono_literals;

void TestSchedulerSectionMapsOntoOptions() {
  auto config = recall::config::ConfigLoader::LoadFromYamlString(R"(scheduler:
  default_due_limit: 20
  max_due_limit: 200
  replay_window: "45s"
  due_soon_window: "3600s"
  day_boundary_utc_offset_minutes: 540
  streak_lookback_days: 90
)");

  const auto scheduler_options = recall::factory::SchedulerOptionsFrom(config.scheduler());
  assert(scheduler_options.default_due_limit == 20);
  assert(scheduler_options.max_due_limit == 200);
  assert(scheduler_options.replay_window == 45s);

  const auto statistics_options = recall::factory::StatisticsOptionsFrom(config.scheduler());
  assert(statistics_options.calendar.UtcOffset() == std::chrono::minutes(540));
  assert(statistics_options.streak_lookback_days == 90);

  assert(recall::factory::DueSoonWindowFrom(config.scheduler()) == 1h);
}

void TestDefaultsApplyForEmptySection() {
  const recall::runtime::config::SchedulerConfig empty;

  const auto scheduler_options = recall::factory::SchedulerOptionsFrom(empty);
  assert(scheduler_options.default_due_limit == 50);
  assert(scheduler_options.max_due_limit == 500);
  assert(scheduler_options.replay_window == 30s);

  const auto statistics_options = recall::factory::StatisticsOptionsFrom(empty);
  assert(statistics_options.calendar.UtcOffset() == std::chrono::minutes(0));
  assert(statistics_options.streak_lookback_days == 365);

  assert(recall::factory::DueSoonWindowFrom(empty) == 2h);
}

void TestBuildWiresMemoryBackend() {
  recall::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  auto app = recall::factory::Build(config);
  assert(app.repository);
  assert(app.scheduler);
  assert(app.statistics);
  assert(app.reminders);
  assert(app.review_service);
  assert(app.stats_service);
  assert(app.grpc_services.size() == 2);
  assert(app.scheduler->GetOptions().default_due_limit == 50);
}

#if RECALL_DB_SQLITE
void TestBuildBootstrapsSqliteSchema() {
  const auto db_path = std::filesystem::temp_directory_path() / "recall_factory_test.sqlite";
  std::filesystem::remove(db_path);

  recall::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path.string());

  {
    auto app = recall::factory::Build(config);

    recall::scheduler::v1::ScheduleItemRequest req;
    req.set_user_id("alice");
    req.set_content_id("q-1");
    req.set_content_type(recall::scheduler::v1::CONTENT_TYPE_QUESTION);
    assert(app.review_service->ScheduleItem(req).created());
  }

  // schema bootstrap is idempotent and data survives a rebuild
  {
    auto app = recall::factory::Build(config);

    recall::scheduler::v1::ScheduleItemRequest req;
    req.set_user_id("alice");
    req.set_content_id("q-1");
    req.set_content_type(recall::scheduler::v1::CONTENT_TYPE_QUESTION);
    assert(!app.review_service->ScheduleItem(req).created());
  }

  std::filesystem::remove(db_path);
}
#endif

} // namespace

int main() {
  TestSchedulerSectionMapsOntoOptions();
  TestDefaultsApplyForEmptySection();
  TestBuildWiresMemoryBackend();
#if RECALL_DB_SQLITE
  TestBuildBootstrapsSqliteSchema();
#endif

  std::cout << "recall_unit_factory: pass\n";
  return 0;
}
