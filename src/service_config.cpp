#include "service_config.hpp"
#include "detection_config.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace {

std::string getEnv(const char *name, const std::string &default_value) {
  const char *value = std::getenv(name);
  return value ? value : default_value;
}

size_t getEnvSize(const char *name, size_t default_value) {
  const char *value = std::getenv(name);
  if (value) {
    try {
      const long long parsed = std::stoll(value);
      if (parsed >= 0)
        return static_cast<size_t>(parsed);
      spdlog::warn("Negative value for {}: {}", name, value);
    } catch (const std::exception &) {
      spdlog::warn("Invalid integer value for {}: {}", name, value);
    }
  }
  return default_value;
}

int getEnvInt(const char *name, int default_value) {
  const char *value = std::getenv(name);
  if (value) {
    try {
      return std::stoi(value);
    } catch (const std::exception &) {
      spdlog::warn("Invalid integer value for {}: {}", name, value);
    }
  }
  return default_value;
}

double getEnvDouble(const char *name, double default_value) {
  const char *value = std::getenv(name);
  if (value) {
    try {
      return std::stod(value);
    } catch (const std::exception &) {
      spdlog::warn("Invalid double value for {}: {}", name, value);
    }
  }
  return default_value;
}

// spdlog maps unknown names to `off`, which would silence every alert
std::string getEnvLogLevel(const char *name, const std::string &default_value) {
  const std::string value = getEnv(name, default_value);
  if (spdlog::level::from_str(value) == spdlog::level::off && value != "off") {
    spdlog::warn("Invalid log level for {}: {}", name, value);
    return default_value;
  }
  return value;
}

} // namespace

void ServiceConfig::loadFromEnv() {
  redis_url = getEnv("REDIS_URL", redis_url);
  redis_pool_size = getEnvSize("REDIS_POOL_SIZE", redis_pool_size);
  worker_threads = getEnvSize("WORKER_THREADS", worker_threads);
  history_limit = getEnvSize("HISTORY_LIMIT", history_limit);
  signal_retention = getEnvSize("SIGNAL_RETENTION", signal_retention);
  alert_probability = getEnvDouble("ALERT_PROBABILITY", alert_probability);
  interval_sec = getEnvInt("MONITOR_INTERVAL_SEC", interval_sec);
  log_level = getEnvLogLevel("LOG_LEVEL", log_level);

  history_limit = std::clamp<size_t>(history_limit, 1,
                                     DetectionConfig::max_history);
  if (redis_pool_size == 0)
    redis_pool_size = 1;
  if (worker_threads == 0)
    worker_threads = std::max(1u, std::thread::hardware_concurrency());
  if (interval_sec < 0)
    interval_sec = 0;
}
