#include "health_monitor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::discovery {

HealthMonitor::HealthMonitor(std::shared_ptr<CapabilityIndex> index, std::shared_ptr<clients::WorkerTransport> transport, HealthOptions options)
    : index_(std::move(index)), transport_(std::move(transport)), options_(options) {
}

HealthMonitor::~HealthMonitor() {
  Stop();
}

void HealthMonitor::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&HealthMonitor::Loop, this);
}

void HealthMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

void HealthMonitor::Loop() {
  MARKET_LOG_INFO("health monitor started", {observability::IntField("interval_ms", options_.interval.count())});

  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, options_.interval, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    RunOnce();
    lock.lock();
  }

  MARKET_LOG_INFO("health monitor stopped");
}

size_t HealthMonitor::RunOnce() {
  size_t probed = 0;
  for (const auto& id : index_->Ids()) {
    {
      std::lock_guard lock(mutex_);
      if (stop_requested_ && running_) break;
    }
    ProbeWorker(id);
    ++probed;
  }
  index_->PublishCounts();
  return probed;
}

void HealthMonitor::ProbeWorker(const std::string& id) {
  clients::ProbeResult result;
  try {
    result = transport_->Probe(id, options_.probe_timeout);
  } catch (const std::exception& e) {
    result.ok    = false;
    result.error = e.what();
  }

  try {
    if (result.ok) {
      index_->RecordProbeSuccess(id, result.response_time_ms);
    } else {
      index_->RecordProbeFailure(id);
    }
  } catch (const util::NotFound&) {
    // Unregistered while the probe was in flight.
    return;
  }
}

} // namespace market::discovery
