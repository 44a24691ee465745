#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/clients/execution_client.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/settlement/settlement_coordinator.hpp"
#include "market/v1.hpp"

namespace market::core {

struct OrchestratorOptions {
  // Upper bound on workers invited to one auction.
  uint32_t                  candidate_limit = 50;
  std::chrono::milliseconds default_task_timeout{60'000};
};

/*
  MarketplaceOrchestrator

  One task end to end: discover -> auction -> escrow -> execute -> settle.

  The ledger is only touched once an auction awards. Execution runs on the
  calling thread with no component lock held.
*/
class MarketplaceOrchestrator {
 public:
  MarketplaceOrchestrator(std::shared_ptr<discovery::CapabilityIndex> index, std::shared_ptr<auction::AuctionCoordinator> auctions,
                          std::shared_ptr<settlement::SettlementCoordinator> settlement, std::shared_ptr<clients::ExecutionClient> execution,
                          OrchestratorOptions options = {});

  // Business outcomes (no workers, no award, no funds) come back as
  // NOT_ALLOCATED; malformed tasks throw InvalidArgument.
  market::v1::AllocationResult AllocateAndSettle(const market::v1::TaskSpec& task);

  const OrchestratorOptions& Options() const {
    return options_;
  }

 private:
  clients::ExecutionReport Execute(const market::v1::TaskSpec& task, const std::string& worker_id, std::chrono::milliseconds timeout);

  std::shared_ptr<discovery::CapabilityIndex>        index_;
  std::shared_ptr<auction::AuctionCoordinator>       auctions_;
  std::shared_ptr<settlement::SettlementCoordinator> settlement_;
  std::shared_ptr<clients::ExecutionClient>          execution_;
  OrchestratorOptions                                options_;
};

} // namespace market::core
