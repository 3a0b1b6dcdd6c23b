#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/core/review_scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/review_service.hpp"
#include "internal/service/stats_service.hpp"
#include "internal/stats/reminder_builder.hpp"
#include "internal/stats/statistics_aggregator.hpp"

namespace recall::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::ReviewScheduler>       scheduler;
  std::shared_ptr<stats::StatisticsAggregator> statistics;
  std::shared_ptr<stats::ReminderBuilder>      reminders;

  std::shared_ptr<service::ReviewService> review_service;
  std::shared_ptr<service::StatsService>  stats_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Scheduler section of the config with defaults applied.
core::ReviewScheduler::Options       SchedulerOptionsFrom(const recall::runtime::config::SchedulerConfig& config);
stats::StatisticsAggregator::Options StatisticsOptionsFrom(const recall::runtime::config::SchedulerConfig& config);
std::chrono::milliseconds            DueSoonWindowFrom(const recall::runtime::config::SchedulerConfig& config);

// Opens the configured backend and applies the bootstrap schema.
std::shared_ptr<db::Repository> BuildRepository(const recall::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the application. It is the ONLY place allowed to
  know concrete DB types.
*/
Application Build(const recall::runtime::config::RuntimeConfig& config);

} // namespace recall::factory
