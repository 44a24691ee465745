#include "marketplace_orchestrator.hpp"

#include <stdexcept>

#include "internal/ledger/money.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace market::core {

using market::v1::ALLOCATION_OUTCOME_NOT_ALLOCATED;
using market::v1::ALLOCATION_OUTCOME_REFUNDED;
using market::v1::ALLOCATION_OUTCOME_SETTLED;

namespace {

market::v1::NotAllocatedReason ReasonFor(market::v1::AuctionStatus status) {
  switch (status) {
    case market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS:
      return market::v1::NOT_ALLOCATED_REASON_INSUFFICIENT_BIDDERS;
    case market::v1::AUCTION_STATUS_CANCELED:
      return market::v1::NOT_ALLOCATED_REASON_AUCTION_CANCELED;
    default:
      return market::v1::NOT_ALLOCATED_REASON_AUCTION_EXPIRED;
  }
}

uint64_t ElapsedMs(util::TimePoint started) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - started).count();
  return elapsed > 0 ? static_cast<uint64_t>(elapsed) : 0;
}

} // namespace

MarketplaceOrchestrator::MarketplaceOrchestrator(std::shared_ptr<discovery::CapabilityIndex>        index,
                                                 std::shared_ptr<auction::AuctionCoordinator>       auctions,
                                                 std::shared_ptr<settlement::SettlementCoordinator> settlement,
                                                 std::shared_ptr<clients::ExecutionClient> execution, OrchestratorOptions options)
    : index_(std::move(index)),
      auctions_(std::move(auctions)),
      settlement_(std::move(settlement)),
      execution_(std::move(execution)),
      options_(options) {
  if (!index_ || !auctions_ || !settlement_ || !execution_) {
    throw std::invalid_argument("marketplace orchestrator requires index, auctions, settlement and execution");
  }
}

market::v1::AllocationResult MarketplaceOrchestrator::AllocateAndSettle(const market::v1::TaskSpec& task) {
  observability::SpanScope span("market.allocate_and_settle");
  span.SetAttribute("task_id", task.task_id());

  if (task.task_id().empty()) {
    throw util::InvalidArgument("allocate: task_id is required");
  }
  if (task.requester_id().empty()) {
    throw util::InvalidArgument("allocate: requester_id is required");
  }
  if (task.capabilities().empty()) {
    throw util::InvalidArgument("allocate: at least one capability is required");
  }

  const auto started = util::Now();

  market::v1::AllocationResult result;
  result.set_task_id(task.task_id());

  auto not_allocated = [&](market::v1::NotAllocatedReason reason, const std::string& detail) {
    result.set_outcome(ALLOCATION_OUTCOME_NOT_ALLOCATED);
    result.set_reason(reason);
    result.set_detail(detail);
    result.set_duration_ms(ElapsedMs(started));
    span.SetAttribute("outcome", "not_allocated");
    span.AddEvent(market::v1::NotAllocatedReason_Name(reason));
    MARKET_LOG_WARN("task not allocated", {observability::StringField("task_id", task.task_id()),
                                           observability::StringField("reason", market::v1::NotAllocatedReason_Name(reason)),
                                           observability::StringField("detail", detail)});
    return result;
  };

  // 1. Discovery
  discovery::DiscoveryQuery query;
  query.capabilities.assign(task.capabilities().begin(), task.capabilities().end());
  query.min_reputation = task.min_reputation();
  query.min_quality    = task.min_quality();
  query.preferred_regions.assign(task.preferred_regions().begin(), task.preferred_regions().end());
  query.limit = options_.candidate_limit;

  const auto     matches     = index_->Query(query);
  const uint32_t min_bidders = auctions_->Options().min_bidders;
  span.SetAttribute("candidates", static_cast<int64_t>(matches.size()));
  if (matches.empty() || matches.size() < min_bidders) {
    return not_allocated(market::v1::NOT_ALLOCATED_REASON_NO_ELIGIBLE_WORKERS,
                         std::to_string(matches.size()) + " eligible workers, " + std::to_string(min_bidders) + " required");
  }

  // 2. Auction
  const auto task_timeout = task.timeout_ms() > 0 ? std::chrono::milliseconds(task.timeout_ms()) : options_.default_task_timeout;

  auction::AuctionSpec spec;
  spec.task_id        = task.task_id();
  spec.requester_id   = task.requester_id();
  spec.kind           = task.auction_kind();
  spec.capabilities   = query.capabilities;
  spec.reserve_price  = task.reserve_price();
  spec.max_price      = task.max_price();
  spec.min_reputation = task.min_reputation();
  spec.duration       = task.auction_duration_ms() > 0 ? std::chrono::milliseconds(task.auction_duration_ms()) : auctions_->Options().default_duration;
  spec.task_timeout   = task_timeout;
  spec.candidate_ids.reserve(matches.size());
  for (const auto& match : matches) {
    spec.candidate_ids.push_back(match.worker.id);
  }

  std::string auction_id;
  try {
    auction_id = auctions_->CreateAuction(spec);
  } catch (const util::NoEligibleWorkers& e) {
    return not_allocated(market::v1::NOT_ALLOCATED_REASON_NO_ELIGIBLE_WORKERS, e.what());
  }
  result.set_auction_id(auction_id);
  span.SetAttribute("auction_id", auction_id);

  const auto outcome = auctions_->AwaitOutcome(auction_id);
  if (outcome.status != market::v1::AUCTION_STATUS_AWARDED || !outcome.winning_bid) {
    return not_allocated(ReasonFor(outcome.status), "auction ended " + market::v1::AuctionStatus_Name(outcome.status));
  }

  const auto& winner = *outcome.winning_bid;
  result.set_worker_id(winner.worker_id);
  result.set_final_price(outcome.final_price);
  span.SetAttribute("worker_id", winner.worker_id);
  span.SetAttribute("final_price", outcome.final_price);

  // 3. Escrow
  settlement::EscrowRequest request;
  request.task_id    = task.task_id();
  request.auction_id = auction_id;
  request.payer_id   = task.requester_id();
  request.worker_id  = winner.worker_id;
  request.amount     = ledger::ToMicros(outcome.final_price);
  request.timeout    = task_timeout;

  settlement::EscrowHandle handle;
  try {
    handle = settlement_->OpenEscrow(request);
  } catch (const util::InsufficientFunds& e) {
    return not_allocated(market::v1::NOT_ALLOCATED_REASON_INSUFFICIENT_FUNDS, e.what());
  }
  result.set_channel_id(handle.channel_id);

  // 4. Execution
  const auto report = Execute(task, winner.worker_id, task_timeout);

  // 5. Settlement
  settlement::SettlementResult settled;
  try {
    settled = settlement_->Settle(handle, report);
  } catch (const std::exception& e) {
    // Nothing was paid out; the open hold is refunded by the escrow reaper.
    result.set_outcome(ALLOCATION_OUTCOME_REFUNDED);
    result.set_detail(std::string("settlement failed: ") + e.what());
    result.set_duration_ms(ElapsedMs(started));
    span.RecordException(e.what());
    span.SetAttribute("outcome", "settlement_failed");
    MARKET_LOG_ERROR("task settlement failed", {observability::StringField("task_id", task.task_id()),
                                                observability::StringField("channel_id", handle.channel_id),
                                                observability::StringField("worker_id", winner.worker_id),
                                                observability::StringField("error", e.what())});
    return result;
  }
  result.set_outcome(settled.success ? ALLOCATION_OUTCOME_SETTLED : ALLOCATION_OUTCOME_REFUNDED);
  result.set_settled_micros(settled.release.paid);
  result.set_refunded_micros(settled.release.refunded);
  result.set_reputation_delta(settled.reputation_delta);
  if (!settled.success && !report.error.empty()) {
    result.set_detail(report.error);
  }
  result.set_duration_ms(ElapsedMs(started));

  span.SetAttribute("outcome", settled.success ? "settled" : "refunded");
  MARKET_LOG_INFO("task allocated", {observability::StringField("task_id", task.task_id()), observability::StringField("auction_id", auction_id),
                                     observability::StringField("worker_id", winner.worker_id),
                                     observability::DoubleField("final_price", outcome.final_price),
                                     observability::BoolField("settled", settled.success),
                                     observability::IntField("duration_ms", static_cast<int64_t>(result.duration_ms()))});
  return result;
}

clients::ExecutionReport MarketplaceOrchestrator::Execute(const market::v1::TaskSpec& task, const std::string& worker_id,
                                                          std::chrono::milliseconds timeout) {
  clients::ExecutionRequest request;
  request.task_id   = task.task_id();
  request.worker_id = worker_id;
  request.capabilities.assign(task.capabilities().begin(), task.capabilities().end());
  request.input   = task.input();
  request.timeout = timeout;

  const auto started = util::Now();
  try {
    return execution_->Execute(request);
  } catch (const std::exception& e) {
    MARKET_LOG_ERROR("task execution failed",
                     {observability::StringField("task_id", task.task_id()), observability::StringField("worker_id", worker_id),
                      observability::StringField("error", e.what())});
    clients::ExecutionReport failed;
    failed.success  = false;
    failed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - started);
    failed.error    = e.what();
    return failed;
  }
}

} // namespace market::core
