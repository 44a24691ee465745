#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/clients/execution_client.hpp"
#include "internal/clients/reputation_client.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/ledger/escrow_ledger.hpp"
#include "internal/settlement/reputation_policy.hpp"

namespace market::settlement {

struct EscrowRequest {
  std::string               task_id;
  std::string               auction_id;
  std::string               payer_id;
  std::string               worker_id;
  ledger::Micros            amount = 0;
  std::chrono::milliseconds timeout{0};
};

struct EscrowHandle {
  // Empty when nothing was escrowed (zero clearing price).
  std::string               channel_id;
  std::string               task_id;
  std::string               auction_id;
  std::string               payer_id;
  std::string               worker_id;
  ledger::Micros            amount = 0;
  std::chrono::milliseconds timeout{0};
  util::TimePoint           opened_at{};
};

struct SettlementResult {
  bool                  success = false;
  ledger::ReleaseResult release;
  double                reputation_delta = 0.0;
  // Score reported back by the reputation service, when it answered.
  std::optional<double> reputation_after;
  bool                  channel_closed = false;
};

/*
  SettlementCoordinator

  Turns an auction award into a funded escrow and an execution report into
  a release or refund. The ledger decides exactly-once; everything after the
  release (reputation, channel close, load) is best effort and logged.
*/
class SettlementCoordinator {
 public:
  SettlementCoordinator(std::shared_ptr<ledger::EscrowLedger> ledger, std::shared_ptr<clients::ReputationClient> reputation,
                        std::shared_ptr<discovery::CapabilityIndex> index = nullptr, ReputationPolicy policy = ReputationPolicy{});

  // OpenChannel + LockEscrow. A failed lock closes the channel again
  // (refunding the payer) and rethrows.
  EscrowHandle OpenEscrow(const EscrowRequest& request);

  // Releases the worker's load slot on every path. A failed ledger release
  // rethrows and leaves the hold to the escrow reaper.
  SettlementResult Settle(const EscrowHandle& handle, const clients::ExecutionReport& report);

  // Succeeded, not timed out and within the timeout (0 = unbounded).
  static bool Succeeded(const clients::ExecutionReport& report, std::chrono::milliseconds timeout);

  const ReputationPolicy& Policy() const {
    return policy_;
  }

 private:
  void AcquireLoad(const std::string& worker_id);
  void ReleaseLoad(const std::string& worker_id);

  std::shared_ptr<ledger::EscrowLedger>       ledger_;
  std::shared_ptr<clients::ReputationClient>  reputation_;
  std::shared_ptr<discovery::CapabilityIndex> index_;
  ReputationPolicy                            policy_;
};

} // namespace market::settlement
