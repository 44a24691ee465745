#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/clients/worker_transport.hpp"
#include "internal/discovery/capability_index.hpp"

namespace market::discovery {

struct HealthOptions {
  std::chrono::milliseconds interval{30'000};
  std::chrono::milliseconds probe_timeout{5'000};
};

/*
  Periodic liveness prober.

  Each round snapshots the registered ids, probes every worker through the
  transport with no index lock held, then applies the result to the index
  (EWMA response time, failure counting, offline/online transitions).
*/
class HealthMonitor {
 public:
  HealthMonitor(std::shared_ptr<CapabilityIndex> index, std::shared_ptr<clients::WorkerTransport> transport, HealthOptions options = {});
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&)            = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void Start();
  void Stop();

  // One synchronous probe round; returns the number of workers probed.
  size_t RunOnce();

  bool Running() const {
    return running_;
  }

 private:
  void Loop();
  void ProbeWorker(const std::string& id);

  std::shared_ptr<CapabilityIndex>          index_;
  std::shared_ptr<clients::WorkerTransport> transport_;
  HealthOptions                             options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace market::discovery
