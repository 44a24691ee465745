#include "settlement_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace market::settlement {

SettlementCoordinator::SettlementCoordinator(std::shared_ptr<ledger::EscrowLedger> ledger, std::shared_ptr<clients::ReputationClient> reputation,
                                             std::shared_ptr<discovery::CapabilityIndex> index, ReputationPolicy policy)
    : ledger_(std::move(ledger)), reputation_(std::move(reputation)), index_(std::move(index)), policy_(std::move(policy)) {
  if (!ledger_) {
    throw std::invalid_argument("settlement coordinator requires a ledger");
  }
}

bool SettlementCoordinator::Succeeded(const clients::ExecutionReport& report, std::chrono::milliseconds timeout) {
  if (!report.success || report.timed_out) {
    return false;
  }
  return timeout.count() <= 0 || report.duration <= timeout;
}

EscrowHandle SettlementCoordinator::OpenEscrow(const EscrowRequest& request) {
  observability::SpanScope span("settlement.open_escrow");
  span.SetAttribute("task_id", request.task_id);
  span.SetAttribute("worker_id", request.worker_id);
  span.SetAttribute("amount_micros", request.amount);

  if (request.amount < 0) {
    throw util::InvalidAmount("escrow amount must not be negative");
  }

  EscrowHandle handle;
  handle.task_id    = request.task_id;
  handle.auction_id = request.auction_id;
  handle.payer_id   = request.payer_id;
  handle.worker_id  = request.worker_id;
  handle.amount     = request.amount;
  handle.timeout    = request.timeout;

  if (request.amount == 0) {
    // Zero clearing price: nothing to escrow, the handle carries no channel.
    AcquireLoad(request.worker_id);
    handle.opened_at = util::Now();
    return handle;
  }

  const auto channel = ledger_->OpenChannel(request.payer_id, request.worker_id, request.amount, request.auction_id);

  try {
    ledger_->LockEscrow(channel.id, request.task_id, request.amount);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    MARKET_LOG_WARN("escrow lock failed, closing channel",
                    {observability::StringField("channel_id", channel.id), observability::StringField("task_id", request.task_id),
                     observability::StringField("error", e.what())});
    try {
      ledger_->CloseChannel(channel.id);
    } catch (const std::exception& close_error) {
      MARKET_LOG_ERROR("failed to close channel after escrow lock failure",
                       {observability::StringField("channel_id", channel.id), observability::StringField("error", close_error.what())});
    }
    throw;
  }

  AcquireLoad(request.worker_id);
  handle.channel_id = channel.id;
  handle.opened_at  = util::Now();
  return handle;
}

SettlementResult SettlementCoordinator::Settle(const EscrowHandle& handle, const clients::ExecutionReport& report) {
  observability::SpanScope span("settlement.settle");
  span.SetAttribute("task_id", handle.task_id);
  span.SetAttribute("channel_id", handle.channel_id);

  SettlementResult result;
  result.success = Succeeded(report, handle.timeout);

  const auto change = policy_.Evaluate(result.success, report, handle.timeout);
  if (handle.channel_id.empty()) {
    result.release.task_id = handle.task_id;
    result.release.success = result.success;
  } else {
    try {
      result.release = ledger_->ReleaseEscrow(handle.channel_id, handle.task_id, result.success, change.reason);
    } catch (const std::exception& e) {
      // The hold stays with the ledger; the worker slot must not.
      span.RecordException(e.what());
      MARKET_LOG_ERROR("escrow release failed",
                       {observability::StringField("channel_id", handle.channel_id), observability::StringField("task_id", handle.task_id),
                        observability::StringField("worker_id", handle.worker_id), observability::StringField("error", e.what())});
      ReleaseLoad(handle.worker_id);
      throw;
    }
    result.success = result.release.success;
  }

  if (result.release.already_released) {
    // Settled earlier by the escrow reaper or a retry; that outcome stands.
    MARKET_LOG_WARN("escrow already settled", {observability::StringField("channel_id", handle.channel_id),
                                               observability::StringField("task_id", handle.task_id),
                                               observability::BoolField("success", result.release.success)});
  } else if (reputation_) {
    result.reputation_delta = change.delta;
    try {
      const double score      = reputation_->UpdateScore(handle.worker_id, change.delta, change.reason);
      result.reputation_after = score;
      if (index_) {
        index_->UpdateReputation(handle.worker_id, score);
      }
    } catch (const std::exception& e) {
      MARKET_LOG_WARN("reputation update failed",
                      {observability::StringField("worker_id", handle.worker_id), observability::DoubleField("delta", change.delta),
                       observability::StringField("error", e.what())});
    }
  }

  if (!handle.channel_id.empty()) {
    try {
      ledger_->CloseChannel(handle.channel_id);
      result.channel_closed = true;
    } catch (const util::ChannelClosed&) {
      result.channel_closed = true;
    } catch (const std::exception& e) {
      MARKET_LOG_WARN("channel close after settlement failed",
                      {observability::StringField("channel_id", handle.channel_id), observability::StringField("error", e.what())});
    }
  }

  ReleaseLoad(handle.worker_id);

  span.SetAttribute("success", static_cast<int64_t>(result.success));
  MARKET_LOG_INFO(result.success ? "task settled" : "task refunded",
                  {observability::StringField("task_id", handle.task_id), observability::StringField("worker_id", handle.worker_id),
                   observability::IntField("amount_micros", result.release.amount),
                   observability::DoubleField("reputation_delta", result.reputation_delta)});
  return result;
}

void SettlementCoordinator::AcquireLoad(const std::string& worker_id) {
  if (!index_) {
    return;
  }
  try {
    index_->UpdateLoad(worker_id, 1);
  } catch (const util::NotFound&) {
    MARKET_LOG_WARN("escrow opened for unregistered worker", {observability::StringField("worker_id", worker_id)});
  }
}

void SettlementCoordinator::ReleaseLoad(const std::string& worker_id) {
  if (!index_) {
    return;
  }
  try {
    index_->UpdateLoad(worker_id, -1);
  } catch (const util::NotFound&) {
    // Unregistered while executing.
  }
}

} // namespace market::settlement
