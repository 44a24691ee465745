#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "market/v1.hpp"

namespace market::discovery {

/*
  Registry entry for one worker.

  Capabilities are kept sorted and unique. Reputation and quality are
  snapshots on a 0..100 scale; the reputation service owns the real score.
*/
struct WorkerRecord {
  std::string              id;
  std::vector<std::string> capabilities;

  market::v1::WorkerStatus status = market::v1::WORKER_STATUS_ONLINE;

  uint32_t load     = 0;
  uint32_t capacity = 10;

  util::TimePoint last_seen{};

  // 0 until the first successful probe.
  double   avg_response_time_ms = 0.0;
  uint32_t consecutive_failures = 0;

  std::string region;
  std::string endpoint;

  double reputation    = 0.0;
  double quality_score = 80.0;

  double Utilization() const {
    return capacity == 0 ? 1.0 : static_cast<double>(load) / static_cast<double>(capacity);
  }

  bool HasCapability(const std::string& capability) const;
};

struct DiscoveryQuery {
  std::vector<std::string> capabilities;
  double                   min_reputation       = 0.0;
  double                   min_quality          = 0.0;
  double                   max_response_time_ms = 0.0; // 0 = unbounded
  double                   max_utilization      = 0.0; // 0 = index default
  std::vector<std::string> preferred_regions;
  uint32_t                 limit = 0; // 0 = index default
};

struct DiscoveryMatch {
  WorkerRecord worker;
  double       score = 0.0;
};

struct DiscoveryCounts {
  uint64_t registered  = 0;
  uint64_t online      = 0;
  uint64_t busy        = 0;
  uint64_t offline     = 0;
  uint64_t maintenance = 0;
};

} // namespace market::discovery
