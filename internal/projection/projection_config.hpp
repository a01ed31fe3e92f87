#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chronicle::projection {

/*
  Orchestrator + runner tuning. Defaults match an unconfigured daemon.
*/
struct ProjectionConfig {
  std::string name = "ProductReadModel";

  uint32_t batch_size = 100;

  // retries after the first attempt
  uint32_t                  max_retries              = 3;
  std::chrono::milliseconds initial_retry_delay      = std::chrono::milliseconds(100);
  double                    retry_backoff_multiplier = 2.0;
  std::chrono::milliseconds max_retry_delay          = std::chrono::seconds(10);

  uint64_t lag_warning_threshold = 100;
  uint64_t lag_error_threshold   = 1000;

  std::chrono::milliseconds poll_interval       = std::chrono::seconds(1);
  bool                      auto_start          = true;
  std::chrono::milliseconds health_log_interval = std::chrono::seconds(30);
};

} // namespace chronicle::projection
