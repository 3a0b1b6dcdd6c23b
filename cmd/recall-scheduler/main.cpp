#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

using recall::observability::IntField;
using recall::observability::StringField;
using recall::runtime::config::DatabaseConfig;
using recall::runtime::config::RuntimeConfig;

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Invocation {
  std::string config_path;
  bool        check_only = false; // load and validate, then exit
};

std::optional<Invocation> ParseArgs(int argc, char** argv) {
  Invocation invocation;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      invocation.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      invocation.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && invocation.config_path.empty()) {
      invocation.config_path = arg;
    } else {
      return std::nullopt;
    }
  }

  if (invocation.config_path.empty()) {
    const char* env = std::getenv("RECALL_CONFIG");
    if (env == nullptr || *env == '\0') return std::nullopt;
    invocation.config_path = env;
  }
  return invocation;
}

std::string BackendName(const DatabaseConfig& database) {
  switch (database.backend_case()) {
    case DatabaseConfig::kMemory:
      return "memory";
    case DatabaseConfig::kSqlite:
      return "sqlite:" + database.sqlite().path();
    case DatabaseConfig::kPostgres:
      return "postgres";
    case DatabaseConfig::BACKEND_NOT_SET:
      break;
  }
  return "unset";
}

void LogStartup(const RuntimeConfig& config, const recall::factory::Application& app, const recall::runtime::Server& server) {
  const auto& options   = app.scheduler->GetOptions();
  const auto  due_soon  = recall::factory::DueSoonWindowFrom(config.scheduler());
  const auto  replay_ms = options.replay_window.count();

  RECALL_LOG_INFO("Recall scheduler started",
                  {StringField("bind_address", server.BindAddress()), IntField("port", server.Port()),
                   StringField("backend", BackendName(config.database()))});
  RECALL_LOG_INFO("Scheduler options",
                  {IntField("default_due_limit", options.default_due_limit), IntField("max_due_limit", options.max_due_limit),
                   IntField("replay_window_ms", replay_ms), IntField("due_soon_window_ms", due_soon.count()),
                   IntField("utc_offset_minutes", config.scheduler().day_boundary_utc_offset_minutes())});
}

void ShutdownObservability() {
  recall::observability::ShutdownLogging();
  recall::observability::ShutdownMetrics();
  recall::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  const auto invocation = ParseArgs(argc, argv);
  if (!invocation) {
    std::cerr << "Usage: recall-scheduler [--check-config] <config.yaml>" << std::endl;
    std::cerr << "       recall-scheduler [--check-config] --config <config.yaml>" << std::endl;
    std::cerr << "       (or set RECALL_CONFIG)" << std::endl;
    return 1;
  }

  RuntimeConfig config;
  try {
    config = recall::config::ConfigLoader::LoadFromYaml(invocation->config_path);
  } catch (const std::exception& e) {
    std::cerr << "recall-scheduler: " << invocation->config_path << ": " << e.what() << std::endl;
    return 1;
  }

  if (invocation->check_only) {
    std::cout << invocation->config_path << ": ok (backend " << BackendName(config.database()) << ")" << std::endl;
    return 0;
  }

  try {
    recall::observability::InitializeTracing(config);
    recall::observability::InitializeMetrics(config);
    recall::observability::InitializeLogging(config);

    auto app = recall::factory::Build(config);

    recall::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Handlers go in before Start() so an early signal is not lost.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LogStartup(config, app, server);

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    RECALL_LOG_INFO("Shutting down recall scheduler", {StringField("backend", BackendName(config.database()))});

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RECALL_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
