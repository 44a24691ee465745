#include "escrow_reaper.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::settlement {

EscrowReaper::EscrowReaper(std::shared_ptr<ledger::EscrowLedger> ledger, ReaperOptions options)
    : ledger_(std::move(ledger)), options_(options) {
}

EscrowReaper::~EscrowReaper() {
  Stop();
}

void EscrowReaper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&EscrowReaper::Loop, this);
}

void EscrowReaper::Stop() {
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

void EscrowReaper::Loop() {
  MARKET_LOG_INFO("escrow reaper started", {observability::IntField("interval_ms", options_.interval.count())});

  std::unique_lock lock(mutex_);
  while (!cv_.wait_for(lock, options_.interval, [this] { return stop_requested_; })) {
    lock.unlock();
    try {
      RunOnce(util::Now());
    } catch (const std::exception& e) {
      MARKET_LOG_ERROR("escrow reaper round failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }

  MARKET_LOG_INFO("escrow reaper stopped");
}

size_t EscrowReaper::RunOnce(util::TimePoint now) {
  const auto refunded = ledger_->ExpireStaleEscrows(now);

  std::set<std::string> touched;
  for (const auto& result : refunded) {
    touched.insert(result.channel_id);
  }

  for (const auto& channel_id : touched) {
    const auto channel = ledger_->GetChannel(channel_id);
    if (channel.state != market::v1::CHANNEL_STATE_SETTLING) {
      continue;
    }
    try {
      ledger_->CloseChannel(channel_id);
    } catch (const util::InvalidState& e) {
      // Closed or re-escrowed since the refund.
      MARKET_LOG_WARN("reaper skipped channel close",
                      {observability::StringField("channel_id", channel_id), observability::StringField("error", e.what())});
    }
  }
  return refunded.size();
}

} // namespace market::settlement
