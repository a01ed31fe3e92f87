#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/projection/projection_health.hpp"
#include "internal/projection/projection_runner.hpp"

using chronicle::factory::BuildRuntime;
using chronicle::observability::BoolField;
using chronicle::observability::IntField;
using chronicle::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void LogHealth(const chronicle::projection::ProjectionRunner& runner) {
  const auto health = runner.Health();
  if (health.healthy) {
    CHRONICLE_LOG_INFO("projection health", {StringField("projection", health.projection_name), BoolField("healthy", true),
                                             IntField("lag", static_cast<int64_t>(health.lag)),
                                             StringField("state", ToString(runner.State()))});
  } else {
    CHRONICLE_LOG_WARN("projection health", {StringField("projection", health.projection_name), BoolField("healthy", false),
                                             IntField("lag", static_cast<int64_t>(health.lag)),
                                             StringField("state", ToString(runner.State())), StringField("message", health.message)});
  }
}

static void Shutdown() {
  chronicle::observability::ShutdownLogging();
  chronicle::observability::ShutdownMetrics();
  chronicle::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: chronicle-projector <config.yaml> OR chronicle-projector --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chronicle::config::ConfigLoader::LoadFromYaml(config_path);

    chronicle::observability::InitializeTracing(config);
    chronicle::observability::InitializeMetrics(config);
    chronicle::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto deps   = BuildRuntime(config);
    auto runner = deps.runner;

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (deps.projection_config.auto_start) {
      if (!runner->Start()) {
        CHRONICLE_LOG_ERROR("projection runner did not start", {StringField("error", runner->Status().last_error)});
      }
    } else {
      CHRONICLE_LOG_INFO("auto start disabled", {StringField("projection", deps.projection_config.name)});
    }

    CHRONICLE_LOG_INFO("chronicle projector started", {StringField("projection", deps.projection_config.name)});

    auto next_health = std::chrono::steady_clock::now() + deps.projection_config.health_log_interval;
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (std::chrono::steady_clock::now() >= next_health) {
        LogHealth(*runner);
        next_health += deps.projection_config.health_log_interval;
      }
    }

    CHRONICLE_LOG_INFO("shutting down chronicle projector");

    runner->Stop();
    Shutdown();
  } catch (const std::exception& e) {
    CHRONICLE_LOG_ERROR("fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
