#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/discovery/worker_record.hpp"

namespace market::discovery {

struct IndexOptions {
  double   default_max_utilization   = 0.8;
  uint32_t default_limit             = 10;
  double   response_time_baseline_ms = 200.0;
  uint32_t failure_threshold         = 3;
  double   ewma_alpha                = 0.3;
};

/*
  CapabilityIndex

  Inverted index capability -> worker ids plus the worker records.

  Locking:
    mutex_          shared for queries, exclusive for Register/Unregister
    Entry::mutex    per-worker mutable fields (status, load, probe state)

  Queries never serialize against each other and never wait on a probe;
  probe results are applied through the short per-entry critical section.
*/
class CapabilityIndex {
 public:
  explicit CapabilityIndex(IndexOptions options = {});

  // Replaces any existing record with the same id.
  WorkerRecord Register(WorkerRecord record);
  void         Unregister(const std::string& id);

  WorkerRecord UpdateStatus(const std::string& id, market::v1::WorkerStatus status);
  WorkerRecord UpdateLoad(const std::string& id, int32_t delta);
  void         UpdateReputation(const std::string& id, double reputation);

  market::v1::WorkerStatus RecordProbeSuccess(const std::string& id, double response_time_ms);
  market::v1::WorkerStatus RecordProbeFailure(const std::string& id);

  std::optional<WorkerRecord> Get(const std::string& id) const;
  std::vector<WorkerRecord>   List() const;
  std::vector<std::string>    Ids() const;
  DiscoveryCounts             Counts() const;

  std::vector<DiscoveryMatch> Query(const DiscoveryQuery& query) const;

  double MatchScore(const WorkerRecord& worker, const DiscoveryQuery& query) const;

  const IndexOptions& Options() const {
    return options_;
  }

  void PublishCounts() const;

 private:
  struct Entry {
    mutable std::mutex mutex;
    WorkerRecord       record;
  };

  std::shared_ptr<Entry> FindOrThrow(const std::string& id) const;

  IndexOptions options_;

  mutable std::shared_mutex                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>>          workers_;
  std::unordered_map<std::string, std::unordered_set<std::string>> postings_;
};

} // namespace market::discovery
