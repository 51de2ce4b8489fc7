#include "internal/config/config_loader.hpp"

#include <google/protobuf/util/time_util.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using forecast::config::ConfigLoader;
using google::protobuf::util::TimeUtil;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "forecast_sync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename E>
bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/tmp/forecast.db"
    wal_mode: true
    busy_timeout: "2.5s"
sync:
  enabled: true
  interval: "30s"
  batch_size: 25
  max_attempts: 4
  backoff_base: "0.500s"
  rate_limit_per_second: 10
retention:
  enabled: true
  interval: "86400s"
  retention_days: 30
  batch_size: 500
archival:
  enabled: true
  filesystem:
    root_path: "/var/lib/forecast/archive"
    compression: ARCHIVE_COMPRESSION_ZSTD
external_system:
  simulated:
    latency: "0.050s"
    accept_unknown_entities: true
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(TimeUtil::DurationToMilliseconds(config.database().sqlite().busy_timeout()) == 2500);

  assert(config.sync().batch_size() == 25);
  assert(config.sync().max_attempts() == 4);
  assert(TimeUtil::DurationToMilliseconds(config.sync().backoff_base()) == 500);
  assert(config.sync().rate_limit_per_second() == 10.0);

  assert(config.retention().retention_days() == 30);
  assert(TimeUtil::DurationToSeconds(config.retention().interval()) == 86400);

  assert(config.archival().filesystem().compression() == forecast::runtime::config::ARCHIVE_COMPRESSION_ZSTD);
  assert(config.external_system().simulated().accept_unknown_entities());
  assert(TimeUtil::DurationToMilliseconds(config.external_system().simulated().latency()) == 50);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\forecast\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\forecast\\\"quoted\"\\db.sqlite");
}

void TestMemoryBackendNeedsNoSettings() {
  const auto config = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects<std::runtime_error>(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");

  assert(Rejects<std::runtime_error>("sync:\n  interval: \"soon\"\n"));
}

void TestCrossFieldValidation() {
  using forecast::util::ConfigurationError;

  assert(Rejects<ConfigurationError>("archival:\n  enabled: true\n"));
  assert(Rejects<ConfigurationError>("archival:\n  filesystem:\n    root_path: \"\"\n"));
  assert(Rejects<ConfigurationError>("sync:\n  rate_limit_per_second: -1\n"));
  assert(Rejects<ConfigurationError>("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects<ConfigurationError>("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects<ConfigurationError>("logging:\n  level: \"chatty\"\n"));
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/forecast-sync.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMemoryBackendNeedsNoSettings();
  TestUnknownFieldsAreRejected();
  TestCrossFieldValidation();
  TestMissingFileFails();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
