#include "snapshot_store.hpp"
#include "snapshot_codec.hpp"
#include <ctime>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>

using json = nlohmann::json;

std::string SnapshotStore::snapshotKey(const std::string &symbol,
                                       const std::string &expiry) {
  return "gamma:snapshots:" + symbol + ":" + expiry;
}

std::string SnapshotStore::signalKey(const std::string &symbol,
                                     const std::string &expiry) {
  return "gamma:signals:" + symbol + ":" + expiry;
}

sw::redis::Redis &SnapshotStore::nextConnection() {
  return *connection_pool_[counter_++ % pool_size_];
}

std::vector<MarketSnapshot>
SnapshotStore::getRecentSnapshots(const std::string &symbol,
                                  const std::string &expiry, size_t limit) {
  std::vector<MarketSnapshot> snapshots;
  if (limit == 0)
    return snapshots;

  const auto key = snapshotKey(symbol, expiry);
  try {
    auto &redis = nextConnection();

    std::vector<std::pair<std::string, double>> members;
    redis.zrevrange(key, 0, static_cast<long long>(limit) - 1,
                    std::back_inserter(members));

    snapshots.reserve(members.size());
    for (const auto &[member, score] : members) {
      try {
        auto snapshot = snapshotFromJson(json::parse(member));
        if (!snapshot) {
          spdlog::error("Snapshot is not a JSON object: {}", member);
          continue;
        }
        // The score is the authoritative sample time
        snapshot->timestamp = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(score));
        snapshots.push_back(std::move(*snapshot));
      } catch (const json::exception &e) {
        spdlog::error("Failed to parse snapshot: {}\nData: {}", e.what(),
                      member);
      }
    }

    spdlog::debug("Loaded {} of {} snapshots from {}", snapshots.size(),
                  members.size(), key);

  } catch (const sw::redis::Error &e) {
    spdlog::error("Redis error reading {}: {}", key, e.what());
    snapshots.clear();
  }

  return snapshots;
}

bool SnapshotStore::publishSignal(
    const std::string &symbol, const std::string &expiry,
    const GammaBlastSignal &signal,
    std::chrono::system_clock::time_point timestamp) {
  const auto key = signalKey(symbol, expiry);
  try {
    auto &redis = nextConnection();
    const auto payload = signalToJson(signal, symbol, expiry, timestamp).dump();
    const auto score = static_cast<double>(
        std::chrono::system_clock::to_time_t(timestamp));

    redis.zadd(key, payload, score);
    if (signal_retention_ > 0) {
      // Keep only the newest signal_retention_ entries
      redis.zremrangebyrank(key, 0,
                            -static_cast<long long>(signal_retention_) - 1);
    }
    return true;
  } catch (const sw::redis::Error &e) {
    spdlog::error("Redis error publishing to {}: {}", key, e.what());
  } catch (const json::exception &e) {
    spdlog::error("Failed to encode signal for {}: {}", key, e.what());
  }
  return false;
}
