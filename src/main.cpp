#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <optional>
#include <queue>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "gamma_blast_detector.hpp"
#include "in_flight_pairs.hpp"
#include "service_config.hpp"
#include "snapshot_store.hpp"

namespace {

std::atomic<bool> g_terminate{false};

void handleSignal(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_terminate = true;
  }
}

struct PairKey {
  std::string symbol;
  std::string expiry;

  std::string key() const { return symbol + ":" + expiry; }
};

std::optional<PairKey> parsePairKey(const std::string &arg) {
  const auto sep = arg.find(':');
  if (sep == std::string::npos || sep == 0 || sep + 1 == arg.size())
    return std::nullopt;
  return PairKey{arg.substr(0, sep), arg.substr(sep + 1)};
}

} // namespace

class SignalProcessor {
public:
  SignalProcessor(size_t num_threads, SnapshotStore &store,
                  const ServiceConfig &config)
      : store_(store), config_(config), detector_(), workers_(),
        work_queues_(num_threads), queue_mutexes_(num_threads), queue_mutex_(),
        queue_cv_(), should_stop_(false) {

    for (size_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([this, i] { processWorker(i); });
    }
  }

  // Drains every queued pair before joining
  ~SignalProcessor() {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      should_stop_ = true;
    }
    queue_cv_.notify_all();
    for (auto &worker : workers_) {
      worker.join();
    }
  }

  // False when the pair from an earlier round is still queued or running
  bool addTask(const PairKey &pair) {
    if (!in_flight_.tryAcquire(pair.key()))
      return false;

    size_t queue_index = round_robin_++ % work_queues_.size();

    {
      std::unique_lock<std::mutex> lock(queue_mutexes_[queue_index]);
      work_queues_[queue_index].push(pair);
    }
    // A worker between its predicate check and wait() still holds queue_mutex_
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
    }
    queue_cv_.notify_one();
    return true;
  }

private:
  bool takeTask(size_t queue_index, PairKey &task) {
    std::unique_lock<std::mutex> lock(queue_mutexes_[queue_index]);
    if (work_queues_[queue_index].empty())
      return false;
    task = std::move(work_queues_[queue_index].front());
    work_queues_[queue_index].pop();
    return true;
  }

  void processWorker(size_t worker_id) {
    while (true) {
      PairKey task;

      // Own queue first, then steal
      bool found_task = takeTask(worker_id, task);
      for (size_t i = 0; !found_task && i < work_queues_.size(); ++i) {
        if (i != worker_id)
          found_task = takeTask(i, task);
      }

      if (!found_task) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (should_stop_ && allQueuesEmpty()) {
          return;
        }
        queue_cv_.wait(lock,
                       [this] { return should_stop_ || !allQueuesEmpty(); });
        continue;
      }

      processPair(task);
      in_flight_.release(task.key());
    }
  }

  bool allQueuesEmpty() const {
    for (size_t i = 0; i < work_queues_.size(); ++i) {
      std::unique_lock<std::mutex> lock(queue_mutexes_[i]);
      if (!work_queues_[i].empty())
        return false;
    }
    return true;
  }

  void processPair(const PairKey &pair) {
    try {
      // Newest snapshot is scored against the ones before it
      auto snapshots = store_.getRecentSnapshots(pair.symbol, pair.expiry,
                                                 config_.history_limit + 1);

      if (snapshots.empty()) {
        spdlog::warn("No snapshots found for {}:{}", pair.symbol, pair.expiry);
        return;
      }

      const MarketSnapshot current = snapshots.front();
      const std::span<const MarketSnapshot> history{snapshots.begin() + 1,
                                                    snapshots.end()};

      if (history.size() < DetectionConfig::min_adaptive_history) {
        spdlog::debug("{}:{} has {} history samples, using fallback scoring",
                      pair.symbol, pair.expiry, history.size());
      }

      const auto signal = detector_.detect(current, history);

      if (signal.probability >= config_.alert_probability) {
        spdlog::warn("GAMMA BLAST WARNING {}:{}", pair.symbol, pair.expiry);
        spdlog::warn("Probability: {:.2f}", signal.probability);
        spdlog::warn("Direction: {}", toString(signal.direction));
        spdlog::warn("Confidence: {} (~{} min)", toString(signal.confidence),
                     signal.time_to_blast_min);
        for (const auto &trigger : signal.triggers) {
          spdlog::warn("Trigger: {}", trigger);
        }
      } else {
        spdlog::info("{}:{} p={:.2f} {} {} [{}]", pair.symbol, pair.expiry,
                     signal.probability, toString(signal.direction),
                     toString(signal.confidence), toString(signal.mode));
      }

      if (!store_.publishSignal(pair.symbol, pair.expiry, signal,
                                current.timestamp)) {
        spdlog::error("Signal for {}:{} was not published", pair.symbol,
                      pair.expiry);
      }

    } catch (const std::exception &e) {
      spdlog::error("Error processing {}:{}: {}", pair.symbol, pair.expiry,
                    e.what());
    }
  }

  SnapshotStore &store_;
  const ServiceConfig &config_;
  const GammaBlastDetector detector_;
  std::vector<std::thread> workers_;
  std::vector<std::queue<PairKey>> work_queues_;
  mutable std::vector<std::mutex> queue_mutexes_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  bool should_stop_;
  std::atomic<size_t> round_robin_{0};
  InFlightPairs in_flight_;
};

void setupLogger(const std::string &level) {
  auto console = spdlog::stdout_color_mt("console");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::from_str(level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0]
              << " <symbol:expiry> [<symbol:expiry> ...] [--interval <sec>]"
                 " [--debug]"
              << std::endl;
    return 1;
  }

  ServiceConfig config;
  std::vector<std::string> pair_args;
  bool debug_mode = false;
  std::optional<std::string> interval_arg;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--debug") {
      debug_mode = true;
    } else if (arg == "--interval" && i + 1 < argc) {
      interval_arg = argv[++i];
    } else {
      pair_args.push_back(arg);
    }
  }

  try {
    setupLogger(debug_mode ? "debug" : "info");
    config.loadFromEnv();
    if (debug_mode)
      config.log_level = "debug";
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if (interval_arg) {
      try {
        config.interval_sec = std::max(0, std::stoi(*interval_arg));
      } catch (const std::exception &) {
        spdlog::warn("Invalid --interval value: {}", *interval_arg);
      }
    }

    std::vector<PairKey> pairs;
    for (const auto &arg : pair_args) {
      if (auto pair = parsePairKey(arg)) {
        pairs.push_back(std::move(*pair));
      } else {
        spdlog::warn("Ignoring malformed pair '{}', expected symbol:expiry",
                     arg);
      }
    }
    if (pairs.empty()) {
      spdlog::error("No valid symbol:expiry pairs given");
      return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    SnapshotStore store(config.redis_url, config.redis_pool_size,
                        config.signal_retention);

    spdlog::info("Starting gamma blast monitor with {} threads for {} pairs",
                 config.worker_threads, pairs.size());
    SignalProcessor processor(config.worker_threads, store, config);

    do {
      for (const auto &pair : pairs) {
        if (!processor.addTask(pair)) {
          spdlog::warn("{} is still being processed, skipping this round",
                       pair.key());
        }
      }
      const auto deadline = std::chrono::steady_clock::now() +
                            std::chrono::seconds(config.interval_sec);
      while (config.interval_sec > 0 && !g_terminate &&
             std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    } while (config.interval_sec > 0 && !g_terminate);

    spdlog::info("Waiting for queued pairs to finish");

  } catch (const std::exception &e) {
    spdlog::error("Fatal error: {}", e.what());
    return 1;
  }

  spdlog::info("Gamma blast monitor stopped");
  return 0;
}
