#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "recall_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml_text) {
  try {
    (void)recall::config::ConfigLoader::LoadFromYamlString(yaml_text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/recall/recall.db"
logging:
  level: debug
observability:
  tracing_enabled: false
  metrics_enabled: true
  transport: OTLP_TRANSPORT_HTTP
scheduler:
  default_due_limit: 20
  max_due_limit: 200
  replay_window: "45s"
  due_soon_window: 3600s
  day_boundary_utc_offset_minutes: -300
  streak_lookback_days: 90
)");

  auto config = recall::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/recall/recall.db");
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().transport() == recall::runtime::config::OTLP_TRANSPORT_HTTP);

  const auto& scheduler = config.scheduler();
  assert(scheduler.default_due_limit() == 20);
  assert(scheduler.max_due_limit() == 200);
  assert(scheduler.replay_window().seconds() == 45);
  assert(scheduler.due_soon_window().seconds() == 3600);
  assert(scheduler.day_boundary_utc_offset_minutes() == -300);
  assert(scheduler.streak_lookback_days() == 90);
}

void TestDefaultsWhenSectionsAreMissing() {
  auto config = recall::config::ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:50061\"\n");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  assert(!config.scheduler().has_replay_window());
  assert(config.scheduler().default_due_limit() == 0);

  // an empty document is the default config
  auto empty = recall::config::ConfigLoader::LoadFromYamlString("");
  assert(empty.server().bind_address().empty());
}

void TestQuotedScalarsStayStrings() {
  auto config = recall::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "8080"
database:
  sqlite:
    path: "C:\\recall\\\"quoted\"\\db.sqlite"
)");
  assert(config.server().bind_address() == "8080");
  assert(config.database().sqlite().path() == "C:\\recall\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("server:\n  bind_address: \"0.0.0.0:50061\"\nunknown_field: 123\n"));
  assert(Rejects("scheduler:\n  due_limit: 10\n"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("scheduler:\n  default_due_limit: 600\n  max_due_limit: 500\n"));
  assert(Rejects("scheduler:\n  replay_window: \"-5s\"\n"));
  assert(Rejects("scheduler:\n  day_boundary_utc_offset_minutes: 900\n"));
  assert(Rejects("scheduler:\n  day_boundary_utc_offset_minutes: -721\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("database:\n  sqlite: {}\n"));
  assert(Rejects("logging:\n  level: loud\n"));
  assert(Rejects("- just\n- a list\n"));
}

void TestShippedExampleLoads() {
  const auto path   = std::filesystem::path(RECALL_SOURCE_DIR) / "config" / "recall.example.yaml";
  auto       config = recall::config::ConfigLoader::LoadFromYaml(path.string());
  assert(config.database().has_sqlite());
  assert(config.logging().level() == "info");
  assert(config.scheduler().replay_window().seconds() == 30);
  assert(config.scheduler().due_soon_window().seconds() == 7200);
  assert(config.scheduler().streak_lookback_days() == 365);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)recall::config::ConfigLoader::LoadFromYaml("/nonexistent/recall.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsWhenSectionsAreMissing();
  TestQuotedScalarsStayStrings();
  TestShippedExampleLoads();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "recall_unit_config_loader: pass\n";
  return 0;
}
