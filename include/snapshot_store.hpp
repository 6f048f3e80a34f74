#pragma once
#include "gamma_blast_signal.hpp"
#include "market_snapshot.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>
#include <vector>

// Redis-backed snapshot history and signal sink. Snapshots for a pair live in
// the sorted set gamma:snapshots:<symbol>:<expiry> scored by epoch seconds.
class SnapshotStore {
public:
  explicit SnapshotStore(const std::string &url, size_t pool_size = 8,
                         size_t signal_retention = 500)
      : pool_size_(pool_size == 0 ? 1 : pool_size),
        signal_retention_(signal_retention) {
    connection_pool_.reserve(pool_size_);
    for (size_t i = 0; i < pool_size_; ++i) {
      connection_pool_.emplace_back(std::make_unique<sw::redis::Redis>(url));
    }
  }

  // Newest `limit` snapshots, newest first. Empty on any Redis error.
  std::vector<MarketSnapshot> getRecentSnapshots(const std::string &symbol,
                                                 const std::string &expiry,
                                                 size_t limit);

  bool publishSignal(const std::string &symbol, const std::string &expiry,
                     const GammaBlastSignal &signal,
                     std::chrono::system_clock::time_point timestamp);

  static std::string snapshotKey(const std::string &symbol,
                                 const std::string &expiry);
  static std::string signalKey(const std::string &symbol,
                               const std::string &expiry);

private:
  sw::redis::Redis &nextConnection();

  size_t pool_size_;
  size_t signal_retention_;
  std::vector<std::unique_ptr<sw::redis::Redis>> connection_pool_;
  std::atomic<size_t> counter_{0};
};
