#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/discovery/capability_index.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::discovery::CapabilityIndex;
using market::discovery::DiscoveryQuery;
using market::discovery::WorkerRecord;
using market::v1::WORKER_STATUS_BUSY;
using market::v1::WORKER_STATUS_MAINTENANCE;
using market::v1::WORKER_STATUS_OFFLINE;
using market::v1::WORKER_STATUS_ONLINE;

WorkerRecord MakeWorker(const std::string& id, std::vector<std::string> capabilities, double reputation = 80, double quality = 80) {
  WorkerRecord record;
  record.id            = id;
  record.capabilities  = std::move(capabilities);
  record.reputation    = reputation;
  record.quality_score = quality;
  record.capacity      = 10;
  return record;
}

DiscoveryQuery QueryFor(std::vector<std::string> capabilities) {
  DiscoveryQuery query;
  query.capabilities = std::move(capabilities);
  return query;
}

void TestIntersectionRequiresEveryCapability() {
  CapabilityIndex index;
  index.Register(MakeWorker("both", {"image-processing", "resize"}));
  index.Register(MakeWorker("superset", {"image-processing", "resize", "crop"}));
  index.Register(MakeWorker("image-only", {"image-processing"}));
  index.Register(MakeWorker("resize-only", {"resize"}));

  const auto matches = index.Query(QueryFor({"image-processing", "resize"}));
  assert(matches.size() == 2);
  for (const auto& match : matches) {
    assert(match.worker.HasCapability("image-processing"));
    assert(match.worker.HasCapability("resize"));
    assert(match.worker.id != "image-only");
  }
}

void TestEmptyCapabilitySetIsInvalidQuery() {
  CapabilityIndex index;
  index.Register(MakeWorker("w1", {"vision"}));

  bool threw = false;
  try {
    (void)index.Query(DiscoveryQuery{});
  } catch (const market::util::InvalidQuery&) {
    threw = true;
  }
  assert(threw && "empty capability set must be rejected");
}

void TestUnknownCapabilityYieldsEmptyResult() {
  CapabilityIndex index;
  index.Register(MakeWorker("w1", {"vision"}));
  assert(index.Query(QueryFor({"vision", "audio"})).empty());
}

void TestFiltersApplyThresholdsAndStatus() {
  CapabilityIndex index;
  index.Register(MakeWorker("good", {"vision"}, 90, 90));
  index.Register(MakeWorker("low-rep", {"vision"}, 20, 90));
  index.Register(MakeWorker("low-quality", {"vision"}, 90, 10));
  index.Register(MakeWorker("offline", {"vision"}, 95, 95));
  index.Register(MakeWorker("maintenance", {"vision"}, 95, 95));
  index.Register(MakeWorker("loaded", {"vision"}, 95, 95));
  index.UpdateStatus("offline", WORKER_STATUS_OFFLINE);
  index.UpdateStatus("maintenance", WORKER_STATUS_MAINTENANCE);
  index.UpdateLoad("loaded", 9); // utilization 0.9 > default 0.8

  auto query           = QueryFor({"vision"});
  query.min_reputation = 50;
  query.min_quality    = 50;

  const auto matches = index.Query(query);
  assert(matches.size() == 1);
  assert(matches.front().worker.id == "good");

  query.max_utilization = 0.95;
  const auto relaxed    = index.Query(query);
  assert(relaxed.size() == 2);
  assert(relaxed[0].worker.id == "good");
  assert(relaxed[1].worker.id == "loaded");
}

void TestMaxResponseTimeFilter() {
  CapabilityIndex index;
  index.Register(MakeWorker("fast", {"vision"}));
  index.Register(MakeWorker("slow", {"vision"}));
  index.RecordProbeSuccess("fast", 50);
  index.RecordProbeSuccess("slow", 900);

  auto query                 = QueryFor({"vision"});
  query.max_response_time_ms = 500;
  const auto matches         = index.Query(query);
  assert(matches.size() == 1);
  assert(matches.front().worker.id == "fast");
}

void TestMatchScoreWeights() {
  CapabilityIndex index;
  auto            worker = MakeWorker("w", {"vision"}, 100, 100);
  worker.load            = 0;
  worker.region          = "eu-west";

  auto query = QueryFor({"vision"});
  // reputation, quality, idle, unknown response time, no region preference
  assert(std::abs(index.MatchScore(worker, query) - 1.0) < 1e-9);

  query.preferred_regions = {"us-east"};
  assert(std::abs(index.MatchScore(worker, query) - 0.95) < 1e-9);

  worker.load                 = 5;
  worker.avg_response_time_ms = 400; // twice the 200ms baseline
  query.preferred_regions     = {"eu-west"};
  const double expected       = 0.30 + 0.25 + 0.20 * 0.5 + 0.15 * 0.5 + 0.10;
  assert(std::abs(index.MatchScore(worker, query) - expected) < 1e-9);
}

void TestRankingIsDeterministic() {
  CapabilityIndex index;
  index.Register(MakeWorker("charlie", {"vision"}, 80, 80));
  index.Register(MakeWorker("alpha", {"vision"}, 80, 80));
  index.Register(MakeWorker("bravo", {"vision"}, 80, 80));
  index.Register(MakeWorker("top", {"vision"}, 99, 99));

  const auto matches = index.Query(QueryFor({"vision"}));
  assert(matches.size() == 4);
  assert(matches[0].worker.id == "top");
  assert(matches[1].worker.id == "alpha");
  assert(matches[2].worker.id == "bravo");
  assert(matches[3].worker.id == "charlie");

  auto limited  = QueryFor({"vision"});
  limited.limit = 2;
  assert(index.Query(limited).size() == 2);
}

void TestTieBrokenByResponseTimeBeforeId() {
  CapabilityIndex index;
  index.Register(MakeWorker("a", {"vision"}));
  index.Register(MakeWorker("b", {"vision"}));
  // Both under the baseline, so the response time component is equal.
  index.RecordProbeSuccess("a", 150);
  index.RecordProbeSuccess("b", 100);

  const auto matches = index.Query(QueryFor({"vision"}));
  assert(matches.size() == 2);
  assert(matches[0].score == matches[1].score);
  assert(matches[0].worker.id == "b");
}

void TestLoadTracksBusyAndClampsAtZero() {
  CapabilityIndex index;
  auto            worker = MakeWorker("w", {"vision"});
  worker.capacity        = 2;
  index.Register(worker);

  assert(index.UpdateLoad("w", 1).status == WORKER_STATUS_ONLINE);
  assert(index.UpdateLoad("w", 1).status == WORKER_STATUS_BUSY);
  assert(index.UpdateLoad("w", -1).status == WORKER_STATUS_ONLINE);
  const auto drained = index.UpdateLoad("w", -5);
  assert(drained.load == 0);
  assert(drained.status == WORKER_STATUS_ONLINE);
}

void TestProbeFailuresTakeWorkerOfflineAndSuccessRestores() {
  CapabilityIndex index;
  index.Register(MakeWorker("w", {"vision"}));

  assert(index.RecordProbeFailure("w") == WORKER_STATUS_ONLINE);
  assert(index.RecordProbeFailure("w") == WORKER_STATUS_ONLINE);
  assert(index.RecordProbeFailure("w") == WORKER_STATUS_OFFLINE);
  assert(index.Query(QueryFor({"vision"})).empty());

  assert(index.RecordProbeSuccess("w", 40) == WORKER_STATUS_ONLINE);
  assert(index.Get("w")->consecutive_failures == 0);
  assert(index.Query(QueryFor({"vision"})).size() == 1);
}

void TestResponseTimeEwma() {
  CapabilityIndex index;
  index.Register(MakeWorker("w", {"vision"}));
  index.RecordProbeSuccess("w", 100);
  assert(std::abs(index.Get("w")->avg_response_time_ms - 100.0) < 1e-9);
  index.RecordProbeSuccess("w", 200);
  assert(std::abs(index.Get("w")->avg_response_time_ms - 130.0) < 1e-9);
}

void TestMaintenanceIsNotOverriddenByProbe() {
  CapabilityIndex index;
  index.Register(MakeWorker("w", {"vision"}));
  index.UpdateStatus("w", WORKER_STATUS_MAINTENANCE);
  assert(index.RecordProbeSuccess("w", 10) == WORKER_STATUS_MAINTENANCE);
  for (int i = 0; i < 5; ++i) {
    assert(index.RecordProbeFailure("w") == WORKER_STATUS_MAINTENANCE);
  }
}

void TestReRegisterReplacesCapabilities() {
  CapabilityIndex index;
  index.Register(MakeWorker("w", {"vision", "audio"}));
  index.Register(MakeWorker("w", {"text"}));

  assert(index.Query(QueryFor({"vision"})).empty());
  assert(index.Query(QueryFor({"text"})).size() == 1);
  assert(index.Counts().registered == 1);
}

void TestUnregisterAndMissingWorkers() {
  CapabilityIndex index;
  index.Register(MakeWorker("w", {"vision"}));
  index.Unregister("w");
  assert(index.Query(QueryFor({"vision"})).empty());

  bool threw = false;
  try {
    index.Unregister("w");
  } catch (const market::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    index.UpdateLoad("ghost", 1);
  } catch (const market::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRegisterValidation() {
  CapabilityIndex index;
  bool            threw = false;
  try {
    index.Register(MakeWorker("", {"vision"}));
  } catch (const market::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw       = false;
  auto worker = MakeWorker("w", {"vision"});
  worker.capacity = 0;
  try {
    index.Register(worker);
  } catch (const market::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentQueriesAndRegistration() {
  CapabilityIndex index;
  for (int i = 0; i < 20; ++i) {
    index.Register(MakeWorker("seed-" + std::to_string(i), {"vision"}));
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&index, t] {
      for (int i = 0; i < 200; ++i) {
        const auto matches = index.Query(QueryFor({"vision"}));
        assert(!matches.empty());
        index.UpdateLoad("seed-" + std::to_string((t + i) % 20), (i % 2 == 0) ? 1 : -1);
      }
    });
  }
  threads.emplace_back([&index] {
    for (int i = 0; i < 100; ++i) {
      const auto id = "churn-" + std::to_string(i);
      index.Register(MakeWorker(id, {"vision", "audio"}));
      index.Unregister(id);
    }
  });
  for (auto& thread : threads) {
    thread.join();
  }

  assert(index.Counts().registered == 20);
}

} // namespace

int main() {
  TestIntersectionRequiresEveryCapability();
  TestEmptyCapabilitySetIsInvalidQuery();
  TestUnknownCapabilityYieldsEmptyResult();
  TestFiltersApplyThresholdsAndStatus();
  TestMaxResponseTimeFilter();
  TestMatchScoreWeights();
  TestRankingIsDeterministic();
  TestTieBrokenByResponseTimeBeforeId();
  TestLoadTracksBusyAndClampsAtZero();
  TestProbeFailuresTakeWorkerOfflineAndSuccessRestores();
  TestResponseTimeEwma();
  TestMaintenanceIsNotOverriddenByProbe();
  TestReRegisterReplacesCapabilities();
  TestUnregisterAndMissingWorkers();
  TestRegisterValidation();
  TestConcurrentQueriesAndRegistration();

  std::cout << "market_unit_capability_index: pass\n";
  return 0;
}
