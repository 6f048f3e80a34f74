#pragma once
#include <mutex>
#include <string>
#include <unordered_set>

// Keys of (symbol, expiry) pairs that are queued or being scored. A periodic
// run skips a pair whose previous round has not finished.
class InFlightPairs {
public:
  // False if `key` is already in flight
  bool tryAcquire(const std::string &key);
  void release(const std::string &key);
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> keys_;
};
