#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using audit::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "audit_store_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\audit\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\audit\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:6000\"\n");

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_memory());
  assert(config.database().write_timeout().seconds() == 2);

  assert(config.partitions().months_ahead() == 2);
  assert(config.partitions().months_behind() == 1);
  assert(config.partitions().maintenance_interval().seconds() == 3600);

  assert(config.dlq().has_memory());
  assert(config.dlq().max_retries() == 6);
  assert(config.dlq().initial_backoff().seconds() == 1);
  assert(config.dlq().max_backoff().seconds() == 300);
  assert(config.dlq().poll_interval().seconds() == 1);
  assert(config.dlq().workers() == 1);
  assert(config.dlq().batch_size() == 10);
  assert(config.dlq().lease_duration().seconds() == 30);
  assert(config.dlq().max_entries() == 10000);
  assert(config.dlq().shutdown_drain_timeout().seconds() == 10);

  assert(config.analytics().default_time_range() == "7d");
  assert(config.analytics().default_min_samples() == 5);
}

void TestExplicitValuesAndDurations() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
  write_timeout: "0.5s"
dlq:
  sqlite:
    path: "/tmp/dlq.db"
  max_retries: 3
  initial_backoff: "2s"
  workers: 32
analytics:
  default_time_range: "24h"
  default_min_samples: 20
)");

  assert(config.database().write_timeout().seconds() == 0);
  assert(config.database().write_timeout().nanos() == 500000000);
  assert(config.dlq().has_sqlite());
  assert(config.dlq().sqlite().path() == "/tmp/dlq.db");
  assert(config.dlq().max_retries() == 3);
  assert(config.dlq().initial_backoff().seconds() == 2);
  // capped
  assert(config.dlq().workers() == 8);
  assert(config.analytics().default_time_range() == "24h");
  assert(config.analytics().default_min_samples() == 20);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("dlq:\n  sqlite: {}\n"));
  assert(Rejects("analytics:\n  default_min_samples: -1\n"));
  assert(Rejects("analytics:\n  default_time_range: \"2w\"\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/audit-store.yaml");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentGetsDefaults();
  TestExplicitValuesAndDurations();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsRejected();

  std::cout << "audit_store_unit_config_loader: pass\n";
  return 0;
}
