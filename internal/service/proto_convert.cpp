#include "proto_convert.hpp"

namespace market::service {

market::v1::Worker ToProto(const discovery::WorkerRecord& worker) {
  market::v1::Worker out;
  out.set_worker_id(worker.id);
  for (const auto& capability : worker.capabilities) {
    out.add_capabilities(capability);
  }
  out.set_status(worker.status);
  out.set_load(worker.load);
  out.set_capacity(worker.capacity);
  if (worker.last_seen != util::TimePoint{}) {
    *out.mutable_last_seen() = util::ToProto(worker.last_seen);
  }
  out.set_avg_response_time_ms(worker.avg_response_time_ms);
  out.set_consecutive_failures(worker.consecutive_failures);
  out.set_region(worker.region);
  out.set_endpoint(worker.endpoint);
  out.set_reputation(worker.reputation);
  out.set_quality_score(worker.quality_score);
  return out;
}

discovery::WorkerRecord FromProto(const market::v1::Worker& worker) {
  discovery::WorkerRecord out;
  out.id = worker.worker_id();
  out.capabilities.assign(worker.capabilities().begin(), worker.capabilities().end());
  if (worker.status() != market::v1::WORKER_STATUS_UNSPECIFIED) {
    out.status = worker.status();
  }
  out.load = worker.load();
  if (worker.capacity() > 0) {
    out.capacity = worker.capacity();
  }
  out.region   = worker.region();
  out.endpoint = worker.endpoint();
  if (worker.quality_score() > 0.0) {
    out.quality_score = worker.quality_score();
  }
  return out;
}

discovery::DiscoveryQuery FromProto(const market::v1::DiscoveryQuery& query) {
  discovery::DiscoveryQuery out;
  out.capabilities.assign(query.capabilities().begin(), query.capabilities().end());
  out.min_reputation       = query.min_reputation();
  out.min_quality          = query.min_quality();
  out.max_response_time_ms = query.max_response_time_ms();
  out.max_utilization      = query.max_utilization();
  out.preferred_regions.assign(query.preferred_regions().begin(), query.preferred_regions().end());
  out.limit = query.limit();
  return out;
}

market::v1::DiscoveryStats ToProto(const discovery::DiscoveryCounts& counts) {
  market::v1::DiscoveryStats out;
  out.set_registered(counts.registered);
  out.set_online(counts.online);
  out.set_busy(counts.busy);
  out.set_offline(counts.offline);
  out.set_maintenance(counts.maintenance);
  return out;
}

auction::AuctionSpec FromProto(const market::v1::AuctionSpec& spec) {
  auction::AuctionSpec out;
  out.task_id      = spec.task_id();
  out.requester_id = spec.requester_id();
  out.kind         = spec.kind();
  out.capabilities.assign(spec.capabilities().begin(), spec.capabilities().end());
  out.reserve_price  = spec.reserve_price();
  out.max_price      = spec.max_price();
  out.min_reputation = spec.min_reputation();
  out.duration       = std::chrono::milliseconds(spec.duration_ms());
  out.task_timeout   = std::chrono::milliseconds(spec.task_timeout_ms());
  out.max_bids       = spec.max_bids();
  out.min_bidders    = spec.min_bidders();
  out.candidate_ids.assign(spec.candidate_ids().begin(), spec.candidate_ids().end());
  return out;
}

market::v1::AuctionSpec ToProto(const auction::AuctionSpec& spec) {
  market::v1::AuctionSpec out;
  out.set_task_id(spec.task_id);
  out.set_requester_id(spec.requester_id);
  out.set_kind(spec.kind);
  for (const auto& capability : spec.capabilities) {
    out.add_capabilities(capability);
  }
  out.set_reserve_price(spec.reserve_price);
  out.set_max_price(spec.max_price);
  out.set_min_reputation(spec.min_reputation);
  out.set_duration_ms(static_cast<uint64_t>(spec.duration.count()));
  out.set_task_timeout_ms(static_cast<uint64_t>(spec.task_timeout.count()));
  out.set_max_bids(spec.max_bids);
  out.set_min_bidders(spec.min_bidders);
  for (const auto& id : spec.candidate_ids) {
    out.add_candidate_ids(id);
  }
  return out;
}

market::v1::Bid ToProto(const auction::Bid& bid) {
  market::v1::Bid out;
  out.set_bid_id(bid.id);
  out.set_auction_id(bid.auction_id);
  out.set_worker_id(bid.worker_id);
  out.set_price(bid.price);
  out.set_estimated_completion_ms(static_cast<uint64_t>(bid.estimated_completion.count()));
  out.set_reputation(bid.reputation);
  out.set_quality(bid.quality);
  out.set_sequence(bid.sequence);
  *out.mutable_submitted_at() = util::ToProto(bid.submitted_at);
  out.set_score(bid.score);
  return out;
}

market::v1::Auction ToProto(const auction::AuctionSnapshot& snapshot) {
  market::v1::Auction out;
  out.set_auction_id(snapshot.id);
  *out.mutable_spec() = ToProto(snapshot.spec);
  out.set_status(snapshot.status);
  *out.mutable_created_at() = util::ToProto(snapshot.created_at);
  *out.mutable_expires_at() = util::ToProto(snapshot.expires_at);
  for (const auto& bid : snapshot.bids) {
    *out.add_bids() = ToProto(bid);
  }
  if (snapshot.winning_bid) {
    *out.mutable_winning_bid() = ToProto(*snapshot.winning_bid);
  }
  out.set_final_price(snapshot.final_price);
  return out;
}

market::v1::AuctionStats ToProto(const auction::AuctionStats& stats) {
  market::v1::AuctionStats out;
  out.set_created(stats.created);
  out.set_bids_received(stats.bids);
  out.set_awarded(stats.awarded);
  out.set_insufficient_bidders(stats.insufficient);
  out.set_expired(stats.expired);
  out.set_canceled(stats.canceled);
  out.set_open(stats.open);
  return out;
}

market::v1::Account ToProto(const ledger::Account& account) {
  market::v1::Account out;
  out.set_owner_id(account.owner_id);
  out.set_balance_micros(account.balance);
  out.set_total_deposited_micros(account.deposited);
  out.set_total_withdrawn_micros(account.withdrawn);
  out.set_total_earned_micros(account.earned);
  out.set_committed_micros(account.committed);
  out.set_total_spent_micros(account.spent);
  return out;
}

market::v1::PaymentChannel ToProto(const ledger::Channel& channel) {
  market::v1::PaymentChannel out;
  out.set_channel_id(channel.id);
  out.set_payer_id(channel.payer_id);
  out.set_payee_id(channel.payee_id);
  out.set_auction_ref(channel.auction_ref);
  out.set_total_deposit_micros(channel.total_deposit);
  out.set_current_balance_micros(channel.current_balance);
  out.set_escrowed_micros(channel.escrowed);
  out.set_total_settled_micros(channel.total_settled);
  out.set_total_refunded_micros(channel.total_refunded);
  out.set_state(channel.state);
  out.set_sequence(channel.sequence);
  out.set_frozen(channel.frozen);
  *out.mutable_created_at() = util::ToProto(channel.created_at);

  for (const auto& [task_id, hold] : channel.holds) {
    auto* h = out.add_holds();
    h->set_task_id(task_id);
    h->set_amount_micros(hold.amount);
    *h->mutable_locked_at() = util::ToProto(hold.locked_at);
    *h->mutable_deadline()  = util::ToProto(hold.deadline);
    h->set_released(!hold.Active());
    h->set_success(hold.state == ledger::HoldState::kReleased);
  }

  for (const auto& entry : channel.entries) {
    auto* e = out.add_entries();
    e->set_entry_id(entry.id);
    e->set_type(entry.type);
    e->set_amount_micros(entry.amount);
    e->set_task_id(entry.task_id);
    e->set_reason(entry.reason);
    *e->mutable_timestamp() = util::ToProto(entry.at);
    e->set_sequence(entry.sequence);
    e->set_current_balance_micros(entry.balance_after);
    e->set_escrowed_micros(entry.escrowed_after);
    e->set_total_settled_micros(entry.settled_after);
  }
  return out;
}

market::v1::LedgerStats ToProto(const ledger::LedgerStats& stats) {
  market::v1::LedgerStats out;
  out.set_accounts(stats.accounts);
  out.set_channels_opened(stats.channels_opened);
  out.set_channels_closed(stats.channels_closed);
  out.set_escrow_locked_micros(stats.escrow_locked);
  out.set_escrow_released_micros(stats.escrow_released);
  out.set_escrow_refunded_micros(stats.escrow_refunded);
  out.set_invariant_violations(stats.invariant_violations);
  out.set_frozen_channels(stats.frozen_channels);
  return out;
}

} // namespace market::service
