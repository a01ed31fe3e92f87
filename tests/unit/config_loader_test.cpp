#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using chronicle::config::ConfigLoader;
using chronicle::util::ValidationError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "chronicle_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void TestFullFileLoads() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
database:
  sqlite:
    path: "/tmp/chronicle.db"
projection:
  name: ProductReadModel
  batch_size: 50
  max_retries: 5
  initial_retry_delay: 250ms
  retry_backoff_multiplier: 1.5
  max_retry_delay: 2s
  lag_warning_threshold: 10
  lag_error_threshold: 20
  poll_interval: 500ms
  auto_start: false
  health_log_interval: 1m
observability:
  metrics_enabled: false
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/chronicle.db");
  assert(config.observability().transport() == chronicle::runtime::config::OTLP_TRANSPORT_HTTP);

  auto p = ConfigLoader::ProjectionSettings(config);
  assert(p.name == "ProductReadModel");
  assert(p.batch_size == 50);
  assert(p.max_retries == 5);
  assert(p.initial_retry_delay == std::chrono::milliseconds(250));
  assert(p.retry_backoff_multiplier == 1.5);
  assert(p.max_retry_delay == std::chrono::seconds(2));
  assert(p.lag_warning_threshold == 10);
  assert(p.lag_error_threshold == 20);
  assert(p.poll_interval == std::chrono::milliseconds(500));
  assert(!p.auto_start);
  assert(p.health_log_interval == std::chrono::minutes(1));
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  auto p = ConfigLoader::ProjectionSettings(config);
  assert(p.name == "ProductReadModel");
  assert(p.batch_size == 100);
  assert(p.max_retries == 3);
  assert(p.initial_retry_delay == std::chrono::milliseconds(100));
  assert(p.retry_backoff_multiplier == 2.0);
  assert(p.max_retry_delay == std::chrono::seconds(10));
  assert(p.lag_warning_threshold == 100);
  assert(p.lag_error_threshold == 1000);
  assert(p.poll_interval == std::chrono::seconds(1));
  assert(p.auto_start);
  assert(p.health_log_interval == std::chrono::seconds(30));
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://u:p@localhost/db?sslmode=disable"
    max_connections: 4
projection:
  name: "12345"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://u:p@localhost/db?sslmode=disable");
  assert(config.database().postgres().max_connections() == 4);
  assert(ConfigLoader::ProjectionSettings(config).name == "12345");
}

void TestScalarEscapingForBackslashes() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(database:
  sqlite:
    path: "C:\\chronicle\\\"quoted\"\\events.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\chronicle\\\"quoted\"\\events.sqlite");
}

void TestRejectsInvalidSettings() {
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("projection:\n  batch_size: 0\n"); }));
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("projection:\n  retry_backoff_multiplier: 0.5\n"); }));
  assert(ThrowsValidation([] {
    ConfigLoader::LoadFromYamlString("projection:\n  lag_warning_threshold: 50\n  lag_error_threshold: 10\n");
  }));
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("projection:\n  poll_interval: soon\n"); }));
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("projection:\n  poll_interval: 0ms\n"); }));
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("projection:\n  name: \"bad name!\"\n"); }));
}

void TestRejectsUnknownKeys() {
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("projection:\n  batch_sise: 10\n"); }));
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("server:\n  bind_address: 0.0.0.0:1\n"); }));
}

void TestMissingFileFails() {
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYaml("/nonexistent/chronicle/config.yaml"); }));
}

void TestParseDuration() {
  assert(ConfigLoader::ParseDuration("15ms") == std::chrono::milliseconds(15));
  assert(ConfigLoader::ParseDuration("3s") == std::chrono::seconds(3));
  assert(ConfigLoader::ParseDuration("2m") == std::chrono::minutes(2));
  assert(ThrowsValidation([] { ConfigLoader::ParseDuration("10"); }));
  assert(ThrowsValidation([] { ConfigLoader::ParseDuration("10h"); }));
  assert(ThrowsValidation([] { ConfigLoader::ParseDuration("ms"); }));
}

void TestProjectionNames() {
  assert(ConfigLoader::IsValidProjectionName("ProductReadModel"));
  assert(ConfigLoader::IsValidProjectionName("orders_v2-shadow"));
  assert(!ConfigLoader::IsValidProjectionName(""));
  assert(!ConfigLoader::IsValidProjectionName("with space"));
  assert(!ConfigLoader::IsValidProjectionName("dots.are.out"));
}

} // namespace

int main() {
  TestFullFileLoads();
  TestEmptyDocumentUsesDefaults();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForBackslashes();
  TestRejectsInvalidSettings();
  TestRejectsUnknownKeys();
  TestMissingFileFails();
  TestParseDuration();
  TestProjectionNames();

  std::cout << "chronicle_unit_config_loader: pass\n";
  return 0;
}
