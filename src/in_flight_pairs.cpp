#include "in_flight_pairs.hpp"

bool InFlightPairs::tryAcquire(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.insert(key).second;
}

void InFlightPairs::release(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(key);
}

size_t InFlightPairs::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}
