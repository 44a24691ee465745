#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/clients/execution_client.hpp"
#include "internal/clients/reputation_client.hpp"
#include "internal/clients/worker_transport.hpp"

namespace market::testing {

// Transport double: records invites, answers probes from a script.
class FakeTransport final : public clients::WorkerTransport {
 public:
  using BroadcastHook = std::function<void(const std::vector<std::string>&, const market::v1::AuctionInvite&)>;

  void Broadcast(const std::vector<std::string>& worker_ids, const market::v1::AuctionInvite& invite) override {
    BroadcastHook hook;
    {
      std::lock_guard lock(mutex_);
      invites_.push_back({worker_ids, invite});
      hook = on_broadcast_;
    }
    if (hook) {
      hook(worker_ids, invite);
    }
  }

  clients::ProbeResult Probe(const std::string& worker_id, std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    ++probe_count_;
    auto it = probes_.find(worker_id);
    if (it == probes_.end()) {
      return {true, 10.0, {}};
    }
    if (it->second.throws) {
      throw std::runtime_error("connection refused");
    }
    return it->second.result;
  }

  void SetProbe(const std::string& worker_id, bool ok, double response_time_ms = 10.0) {
    std::lock_guard lock(mutex_);
    probes_[worker_id] = {{ok, response_time_ms, ok ? "" : "probe failed"}, false};
  }

  void SetProbeThrows(const std::string& worker_id) {
    std::lock_guard lock(mutex_);
    probes_[worker_id].throws = true;
  }

  void OnBroadcast(BroadcastHook hook) {
    std::lock_guard lock(mutex_);
    on_broadcast_ = std::move(hook);
  }

  size_t InviteCount() const {
    std::lock_guard lock(mutex_);
    return invites_.size();
  }

  std::vector<std::string> LastInvitees() const {
    std::lock_guard lock(mutex_);
    return invites_.empty() ? std::vector<std::string>{} : invites_.back().first;
  }

  size_t ProbeCount() const {
    std::lock_guard lock(mutex_);
    return probe_count_;
  }

 private:
  struct ScriptedProbe {
    clients::ProbeResult result;
    bool                 throws = false;
  };

  mutable std::mutex                                                         mutex_;
  std::vector<std::pair<std::vector<std::string>, market::v1::AuctionInvite>> invites_;
  std::unordered_map<std::string, ScriptedProbe>                             probes_;
  BroadcastHook                                                              on_broadcast_;
  size_t                                                                     probe_count_ = 0;
};

// Execution runtime double returning a fixed report (or throwing).
class FakeExecutionClient final : public clients::ExecutionClient {
 public:
  using ExecuteHook = std::function<void(const clients::ExecutionRequest&)>;

  explicit FakeExecutionClient(clients::ExecutionReport report = {true, false, 0, std::chrono::milliseconds(100), 1.0, {}}) : report_(std::move(report)) {
  }

  clients::ExecutionReport Execute(const clients::ExecutionRequest& request) override {
    ExecuteHook hook;
    {
      std::lock_guard lock(mutex_);
      requests_.push_back(request);
      hook = on_execute_;
    }
    if (hook) {
      hook(request);
    }
    std::lock_guard lock(mutex_);
    if (throws_) {
      throw std::runtime_error("execution runtime unreachable");
    }
    return report_;
  }

  void OnExecute(ExecuteHook hook) {
    std::lock_guard lock(mutex_);
    on_execute_ = std::move(hook);
  }

  void SetReport(clients::ExecutionReport report) {
    std::lock_guard lock(mutex_);
    report_ = std::move(report);
  }

  void SetThrows(bool throws) {
    std::lock_guard lock(mutex_);
    throws_ = throws;
  }

  std::vector<clients::ExecutionRequest> Requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex                     mutex_;
  clients::ExecutionReport               report_;
  bool                                   throws_ = false;
  std::vector<clients::ExecutionRequest> requests_;
  ExecuteHook                            on_execute_;
};

// Reputation service that is always down.
class UnreachableReputationClient final : public clients::ReputationClient {
 public:
  double GetScore(const std::string&) override {
    throw std::runtime_error("reputation service unreachable");
  }

  double UpdateScore(const std::string&, double, const std::string&) override {
    throw std::runtime_error("reputation service unreachable");
  }
};

} // namespace market::testing
