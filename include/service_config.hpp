#pragma once
#include <cstddef>
#include <string>

// Runtime settings of the monitor service. Detection thresholds are
// compile-time constants in DetectionConfig and not configurable here.
struct ServiceConfig {
  std::string redis_url = "redis://127.0.0.1:6379";
  size_t redis_pool_size = 8;
  size_t worker_threads = 0; // 0 = hardware concurrency
  size_t history_limit = 20; // clamped to 1..DetectionConfig::max_history
  size_t signal_retention = 500;
  double alert_probability = 0.60;
  int interval_sec = 0; // 0 = process every pair once
  std::string log_level = "info";

  void loadFromEnv();
};
