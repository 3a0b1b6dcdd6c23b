#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace recall::core { class ReviewScheduler; }
namespace recall::stats { class StatisticsAggregator; class ReminderBuilder; }
namespace recall::db { class Repository; }

namespace recall::service {

/*
  Dependency container shared by all services.

  clock is the only place request handling reads the time; tests pin it.
*/
struct ServiceContext {
  std::shared_ptr<recall::core::ReviewScheduler> scheduler;
  std::shared_ptr<recall::stats::StatisticsAggregator> statistics;
  std::shared_ptr<recall::stats::ReminderBuilder> reminders;
  std::shared_ptr<recall::db::Repository> repository;
  recall::util::ClockFn clock = recall::util::Now;
};

}
