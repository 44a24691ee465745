#include "capability_index.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace market::discovery {

using market::v1::WorkerStatus;
using market::v1::WORKER_STATUS_BUSY;
using market::v1::WORKER_STATUS_MAINTENANCE;
using market::v1::WORKER_STATUS_OFFLINE;
using market::v1::WORKER_STATUS_ONLINE;
using market::v1::WORKER_STATUS_UNSPECIFIED;

namespace {

double Unit(double score) {
  return std::clamp(score / 100.0, 0.0, 1.0);
}

bool Queryable(WorkerStatus status) {
  return status == WORKER_STATUS_ONLINE || status == WORKER_STATUS_BUSY;
}

// online <-> busy follows load; offline and maintenance are left alone.
void ApplyLoadStatus(WorkerRecord& record) {
  if (record.status == WORKER_STATUS_ONLINE && record.load >= record.capacity) {
    record.status = WORKER_STATUS_BUSY;
  } else if (record.status == WORKER_STATUS_BUSY && record.load < record.capacity) {
    record.status = WORKER_STATUS_ONLINE;
  }
}

} // namespace

bool WorkerRecord::HasCapability(const std::string& capability) const {
  return std::binary_search(capabilities.begin(), capabilities.end(), capability);
}

CapabilityIndex::CapabilityIndex(IndexOptions options) : options_(options) {
}

WorkerRecord CapabilityIndex::Register(WorkerRecord record) {
  if (record.id.empty()) {
    throw util::InvalidArgument("register worker: id is required");
  }
  if (record.capacity == 0) {
    throw util::InvalidArgument("register worker: capacity must be positive");
  }

  std::sort(record.capabilities.begin(), record.capabilities.end());
  record.capabilities.erase(std::unique(record.capabilities.begin(), record.capabilities.end()), record.capabilities.end());
  record.capabilities.erase(std::remove(record.capabilities.begin(), record.capabilities.end(), std::string{}), record.capabilities.end());
  if (record.capabilities.empty()) {
    throw util::InvalidArgument("register worker: at least one capability is required");
  }

  if (record.status == WORKER_STATUS_UNSPECIFIED) {
    record.status = WORKER_STATUS_ONLINE;
  }
  ApplyLoadStatus(record);
  record.last_seen = util::Now();

  auto entry    = std::make_shared<Entry>();
  entry->record = record;

  {
    std::unique_lock lock(mutex_);
    if (auto it = workers_.find(record.id); it != workers_.end()) {
      std::lock_guard entry_lock(it->second->mutex);
      for (const auto& capability : it->second->record.capabilities) {
        auto posting = postings_.find(capability);
        if (posting == postings_.end()) continue;
        posting->second.erase(record.id);
        if (posting->second.empty()) postings_.erase(posting);
      }
    }
    workers_[record.id] = entry;
    for (const auto& capability : record.capabilities) {
      postings_[capability].insert(record.id);
    }
  }

  MARKET_LOG_INFO("worker registered", {observability::StringField("worker_id", record.id),
                                        observability::IntField("capabilities", static_cast<int64_t>(record.capabilities.size())),
                                        observability::StringField("region", record.region)});
  PublishCounts();
  return record;
}

void CapabilityIndex::Unregister(const std::string& id) {
  {
    std::unique_lock lock(mutex_);
    auto             it = workers_.find(id);
    if (it == workers_.end()) {
      throw util::NotFound("worker not found: " + id);
    }
    for (const auto& capability : it->second->record.capabilities) {
      auto posting = postings_.find(capability);
      if (posting == postings_.end()) continue;
      posting->second.erase(id);
      if (posting->second.empty()) postings_.erase(posting);
    }
    workers_.erase(it);
  }

  MARKET_LOG_INFO("worker unregistered", {observability::StringField("worker_id", id)});
  PublishCounts();
}

std::shared_ptr<CapabilityIndex::Entry> CapabilityIndex::FindOrThrow(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = workers_.find(id);
  if (it == workers_.end()) {
    throw util::NotFound("worker not found: " + id);
  }
  return it->second;
}

WorkerRecord CapabilityIndex::UpdateStatus(const std::string& id, WorkerStatus status) {
  if (status == WORKER_STATUS_UNSPECIFIED || !market::v1::WorkerStatus_IsValid(status)) {
    throw util::InvalidArgument("update status: invalid worker status");
  }

  auto         entry = FindOrThrow(id);
  WorkerRecord snapshot;
  {
    std::lock_guard lock(entry->mutex);
    entry->record.status = status;
    if (status == WORKER_STATUS_ONLINE) {
      entry->record.consecutive_failures = 0;
      ApplyLoadStatus(entry->record);
    }
    snapshot = entry->record;
  }

  PublishCounts();
  return snapshot;
}

WorkerRecord CapabilityIndex::UpdateLoad(const std::string& id, int32_t delta) {
  auto            entry = FindOrThrow(id);
  std::lock_guard lock(entry->mutex);

  auto& record    = entry->record;
  const auto next = static_cast<int64_t>(record.load) + delta;
  record.load     = next < 0 ? 0 : static_cast<uint32_t>(next);
  ApplyLoadStatus(record);
  return record;
}

void CapabilityIndex::UpdateReputation(const std::string& id, double reputation) {
  auto            entry = FindOrThrow(id);
  std::lock_guard lock(entry->mutex);
  entry->record.reputation = std::clamp(reputation, 0.0, 100.0);
}

WorkerStatus CapabilityIndex::RecordProbeSuccess(const std::string& id, double response_time_ms) {
  auto            entry = FindOrThrow(id);
  std::lock_guard lock(entry->mutex);

  auto& record = entry->record;
  if (record.avg_response_time_ms <= 0.0) {
    record.avg_response_time_ms = response_time_ms;
  } else {
    record.avg_response_time_ms = options_.ewma_alpha * response_time_ms + (1.0 - options_.ewma_alpha) * record.avg_response_time_ms;
  }
  record.consecutive_failures = 0;
  record.last_seen            = util::Now();

  if (record.status == WORKER_STATUS_OFFLINE) {
    record.status = WORKER_STATUS_ONLINE;
    ApplyLoadStatus(record);
    MARKET_LOG_INFO("worker back online", {observability::StringField("worker_id", id)});
  }
  return record.status;
}

WorkerStatus CapabilityIndex::RecordProbeFailure(const std::string& id) {
  auto            entry = FindOrThrow(id);
  std::lock_guard lock(entry->mutex);

  auto& record = entry->record;
  ++record.consecutive_failures;
  if (record.consecutive_failures >= options_.failure_threshold && Queryable(record.status)) {
    record.status = WORKER_STATUS_OFFLINE;
    MARKET_LOG_WARN("worker marked offline",
                    {observability::StringField("worker_id", id), observability::IntField("consecutive_failures", record.consecutive_failures)});
  }
  return record.status;
}

std::optional<WorkerRecord> CapabilityIndex::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = workers_.find(id);
  if (it == workers_.end()) {
    return std::nullopt;
  }
  std::lock_guard entry_lock(it->second->mutex);
  return it->second->record;
}

std::vector<WorkerRecord> CapabilityIndex::List() const {
  std::shared_lock          lock(mutex_);
  std::vector<WorkerRecord> out;
  out.reserve(workers_.size());
  for (const auto& [_, entry] : workers_) {
    std::lock_guard entry_lock(entry->mutex);
    out.push_back(entry->record);
  }
  std::sort(out.begin(), out.end(), [](const WorkerRecord& a, const WorkerRecord& b) { return a.id < b.id; });
  return out;
}

std::vector<std::string> CapabilityIndex::Ids() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(workers_.size());
  for (const auto& [id, _] : workers_) {
    ids.push_back(id);
  }
  return ids;
}

DiscoveryCounts CapabilityIndex::Counts() const {
  std::shared_lock lock(mutex_);
  DiscoveryCounts  counts;
  counts.registered = workers_.size();
  for (const auto& [_, entry] : workers_) {
    std::lock_guard entry_lock(entry->mutex);
    switch (entry->record.status) {
      case WORKER_STATUS_ONLINE:
        ++counts.online;
        break;
      case WORKER_STATUS_BUSY:
        ++counts.busy;
        break;
      case WORKER_STATUS_OFFLINE:
        ++counts.offline;
        break;
      case WORKER_STATUS_MAINTENANCE:
        ++counts.maintenance;
        break;
      default:
        break;
    }
  }
  return counts;
}

void CapabilityIndex::PublishCounts() const {
  const auto counts = Counts();
  observability::Metrics::Instance().SetWorkerCounts(counts.registered, counts.online);
}

double CapabilityIndex::MatchScore(const WorkerRecord& worker, const DiscoveryQuery& query) const {
  double response_time_score = 1.0;
  if (worker.avg_response_time_ms > 0.0 && options_.response_time_baseline_ms > 0.0) {
    const double normalized = std::max(1.0, worker.avg_response_time_ms / options_.response_time_baseline_ms);
    response_time_score     = 1.0 / normalized;
  }

  double region_score = 1.0;
  if (!query.preferred_regions.empty() &&
      std::find(query.preferred_regions.begin(), query.preferred_regions.end(), worker.region) == query.preferred_regions.end()) {
    region_score = 0.5;
  }

  return 0.30 * Unit(worker.reputation) + 0.25 * Unit(worker.quality_score) + 0.20 * (1.0 - std::clamp(worker.Utilization(), 0.0, 1.0)) +
         0.15 * response_time_score + 0.10 * region_score;
}

std::vector<DiscoveryMatch> CapabilityIndex::Query(const DiscoveryQuery& query) const {
  if (query.capabilities.empty()) {
    throw util::InvalidQuery("discovery query requires at least one capability");
  }

  const auto started_at = std::chrono::steady_clock::now();

  std::vector<WorkerRecord> candidates;
  {
    std::shared_lock lock(mutex_);

    std::vector<const std::unordered_set<std::string>*> sets;
    sets.reserve(query.capabilities.size());
    for (const auto& capability : query.capabilities) {
      auto it = postings_.find(capability);
      if (it == postings_.end()) {
        sets.clear();
        break;
      }
      sets.push_back(&it->second);
    }

    if (!sets.empty()) {
      std::sort(sets.begin(), sets.end(), [](const auto* a, const auto* b) { return a->size() < b->size(); });
      for (const auto& id : *sets.front()) {
        bool in_all = true;
        for (size_t i = 1; i < sets.size() && in_all; ++i) {
          in_all = sets[i]->count(id) > 0;
        }
        if (!in_all) continue;

        const auto& entry = workers_.at(id);
        std::lock_guard entry_lock(entry->mutex);
        candidates.push_back(entry->record);
      }
    }
  }

  const double max_utilization = query.max_utilization > 0.0 ? query.max_utilization : options_.default_max_utilization;

  std::vector<DiscoveryMatch> matches;
  matches.reserve(candidates.size());
  for (auto& worker : candidates) {
    if (!Queryable(worker.status)) continue;
    if (worker.reputation < query.min_reputation) continue;
    if (worker.quality_score < query.min_quality) continue;
    if (query.max_response_time_ms > 0.0 && worker.avg_response_time_ms > query.max_response_time_ms) continue;
    if (worker.Utilization() > max_utilization) continue;

    const double score = MatchScore(worker, query);
    matches.push_back({std::move(worker), score});
  }

  std::sort(matches.begin(), matches.end(), [](const DiscoveryMatch& a, const DiscoveryMatch& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.worker.avg_response_time_ms != b.worker.avg_response_time_ms) return a.worker.avg_response_time_ms < b.worker.avg_response_time_ms;
    return a.worker.id < b.worker.id;
  });

  const uint32_t limit = query.limit > 0 ? query.limit : options_.default_limit;
  if (matches.size() > limit) {
    matches.resize(limit);
  }

  observability::Metrics::Instance().ObserveDiscoveryLatencyMs(
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return matches;
}

} // namespace market::discovery
