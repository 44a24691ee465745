#include "auction_coordinator.hpp"

#include <algorithm>

#include "internal/auction/pricing.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace market::auction {

using market::v1::AUCTION_STATUS_AWARDED;
using market::v1::AUCTION_STATUS_CANCELED;
using market::v1::AUCTION_STATUS_CLOSED;
using market::v1::AUCTION_STATUS_EXPIRED;
using market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS;
using market::v1::AUCTION_STATUS_OPEN;

namespace {

db::model::AuctionRecord ToRecord(const std::string& id, const AuctionSpec& spec, market::v1::AuctionStatus status, util::TimePoint created_at,
                                  util::TimePoint expires_at, const std::vector<Bid>& bids, const std::optional<Bid>& winner,
                                  double final_price) {
  db::model::AuctionRecord r;
  r.id             = id;
  r.task_id        = spec.task_id;
  r.requester_id   = spec.requester_id;
  r.kind           = static_cast<int32_t>(spec.kind);
  r.status         = static_cast<int32_t>(status);
  r.reserve_price  = spec.reserve_price;
  r.max_price      = spec.max_price;
  r.final_price    = final_price;
  r.winning_bid_id = winner ? winner->id : "";
  r.created_at_ms  = util::ToUnixMillis(created_at);
  r.expires_at_ms  = util::ToUnixMillis(expires_at);

  r.bids.reserve(bids.size());
  for (const auto& bid : bids) {
    db::model::BidRecord b;
    b.bid_id                  = bid.id;
    b.worker_id               = bid.worker_id;
    b.price                   = bid.price;
    b.estimated_completion_ms = static_cast<uint64_t>(bid.estimated_completion.count());
    b.reputation              = bid.reputation;
    b.quality                 = bid.quality;
    b.sequence                = bid.sequence;
    b.submitted_at_ms         = util::ToUnixMillis(bid.submitted_at);
    b.score                   = bid.score;
    r.bids.push_back(std::move(b));
  }
  return r;
}

AuctionSnapshot FromRecord(const db::model::AuctionRecord& r) {
  AuctionSnapshot snapshot;
  snapshot.id                 = r.id;
  snapshot.spec.task_id       = r.task_id;
  snapshot.spec.requester_id  = r.requester_id;
  snapshot.spec.kind          = static_cast<market::v1::AuctionKind>(r.kind);
  snapshot.spec.reserve_price = r.reserve_price;
  snapshot.spec.max_price     = r.max_price;
  snapshot.status             = static_cast<market::v1::AuctionStatus>(r.status);
  snapshot.created_at         = util::FromUnixMillis(r.created_at_ms);
  snapshot.expires_at         = util::FromUnixMillis(r.expires_at_ms);
  snapshot.final_price        = r.final_price;

  for (const auto& b : r.bids) {
    Bid bid;
    bid.id                   = b.bid_id;
    bid.auction_id           = r.id;
    bid.worker_id            = b.worker_id;
    bid.price                = b.price;
    bid.estimated_completion = std::chrono::milliseconds(b.estimated_completion_ms);
    bid.reputation           = b.reputation;
    bid.quality              = b.quality;
    bid.sequence             = b.sequence;
    bid.submitted_at         = util::FromUnixMillis(b.submitted_at_ms);
    bid.score                = b.score;
    if (bid.id == r.winning_bid_id) {
      snapshot.winning_bid = bid;
    }
    snapshot.bids.push_back(std::move(bid));
  }
  return snapshot;
}

// Higher score first; ties go to the earlier bid.
bool BetterBid(const Bid& a, const Bid& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.submitted_at != b.submitted_at) return a.submitted_at < b.submitted_at;
  return a.sequence < b.sequence;
}

} // namespace

AuctionCoordinator::AuctionCoordinator(std::shared_ptr<clients::WorkerTransport> transport, std::shared_ptr<db::Repository> repository,
                                       std::shared_ptr<discovery::CapabilityIndex> index, AuctionOptions options)
    : transport_(std::move(transport)), repository_(std::move(repository)), index_(std::move(index)), options_(options) {
  if (!transport_) {
    throw std::invalid_argument("auction coordinator requires a worker transport");
  }
}

AuctionCoordinator::~AuctionCoordinator() {
  Stop();
}

std::string AuctionCoordinator::CreateAuction(AuctionSpec spec) {
  if (spec.task_id.empty()) {
    throw util::InvalidArgument("create auction: task_id is required");
  }
  if (spec.duration.count() <= 0) {
    throw util::InvalidArgument("create auction: duration must be positive");
  }
  if (spec.max_price <= 0.0) {
    throw util::InvalidArgument("create auction: max_price must be positive");
  }
  if (spec.reserve_price < 0.0 || spec.reserve_price > spec.max_price) {
    throw util::InvalidArgument("create auction: reserve_price must be within [0, max_price]");
  }
  if (spec.kind == market::v1::AUCTION_KIND_UNSPECIFIED) {
    spec.kind = options_.default_kind;
  }

  std::sort(spec.candidate_ids.begin(), spec.candidate_ids.end());
  spec.candidate_ids.erase(std::unique(spec.candidate_ids.begin(), spec.candidate_ids.end()), spec.candidate_ids.end());
  if (spec.candidate_ids.empty()) {
    throw util::NoEligibleWorkers("create auction: no candidate workers for task " + spec.task_id);
  }

  auto auction        = std::make_shared<Auction>();
  auction->id         = util::NewId("auction");
  auction->spec       = spec;
  auction->created_at = util::Now();
  auction->expires_at = auction->created_at + spec.duration;
  auction->invited.insert(spec.candidate_ids.begin(), spec.candidate_ids.end());

  {
    std::lock_guard lock(auction->mutex);
    Persist(*auction);
  }
  {
    std::unique_lock lock(mutex_);
    auctions_[auction->id]  = auction;
    by_task_[spec.task_id] = auction->id;
  }

  ++created_;
  observability::Metrics::Instance().RecordAuctionCreated(KindName(spec.kind));
  MARKET_LOG_INFO("auction created", {observability::StringField("auction_id", auction->id), observability::StringField("task_id", spec.task_id),
                                      observability::StringField("kind", KindName(spec.kind)),
                                      observability::IntField("candidates", static_cast<int64_t>(spec.candidate_ids.size()))});

  market::v1::AuctionInvite invite;
  invite.set_auction_id(auction->id);
  invite.set_task_id(spec.task_id);
  invite.set_kind(spec.kind);
  for (const auto& capability : spec.capabilities) {
    invite.add_capabilities(capability);
  }
  invite.set_max_price(spec.max_price);
  invite.set_reserve_price(spec.reserve_price);
  *invite.mutable_expires_at() = util::ToProto(auction->expires_at);

  try {
    transport_->Broadcast(spec.candidate_ids, invite);
  } catch (const std::exception& e) {
    // Workers that did get the invite may still bid; the window decides.
    MARKET_LOG_WARN("auction invite broadcast failed",
                    {observability::StringField("auction_id", auction->id), observability::StringField("error", e.what())});
  }

  return auction->id;
}

std::shared_ptr<AuctionCoordinator::Auction> AuctionCoordinator::Find(const std::string& auction_id) const {
  std::shared_lock lock(mutex_);
  auto             it = auctions_.find(auction_id);
  if (it == auctions_.end()) {
    throw util::NotFound("auction not found: " + auction_id);
  }
  return it->second;
}

BidAck AuctionCoordinator::SubmitBid(const std::string& auction_id, const BidSubmission& submission) {
  auto auction = Find(auction_id);

  // With an index the registry snapshot is authoritative; self-reported
  // scores are only used by index-less coordinators.
  double reputation = submission.reputation;
  double quality    = submission.quality;
  if (index_) {
    auto worker = index_->Get(submission.worker_id);
    if (!worker) {
      throw util::InvalidBid("worker " + submission.worker_id + " is not registered");
    }
    reputation = worker->reputation;
    quality    = worker->quality_score;
  }

  std::lock_guard lock(auction->mutex);
  if (auction->status != AUCTION_STATUS_OPEN) {
    throw util::AuctionClosed("auction " + auction_id + " is " + std::string(StatusName(auction->status)));
  }

  const auto now = util::Now();
  if (now >= auction->expires_at) {
    Resolve(*auction);
    throw util::AuctionExpired("auction " + auction_id + " expired");
  }

  const auto& spec = auction->spec;
  if (auction->invited.count(submission.worker_id) == 0) {
    throw util::InvalidBid("worker " + submission.worker_id + " was not invited to auction " + auction_id);
  }
  if (auction->bidders.count(submission.worker_id) > 0) {
    throw util::InvalidBid("worker " + submission.worker_id + " already bid on auction " + auction_id);
  }
  if (submission.price <= 0.0 || submission.price > spec.max_price) {
    throw util::InvalidBid("bid price must be within (0, max_price]");
  }
  if (reputation < spec.min_reputation) {
    throw util::InvalidBid("worker reputation below auction minimum");
  }

  Bid bid;
  bid.id                   = util::NewId("bid");
  bid.auction_id           = auction_id;
  bid.worker_id            = submission.worker_id;
  bid.price                = submission.price;
  bid.estimated_completion = submission.estimated_completion;
  bid.reputation           = reputation;
  bid.quality              = quality;
  bid.sequence             = auction->bids.size() + 1;
  bid.submitted_at         = now;
  bid.score = CompositeScore(bid.price, spec.max_price, bid.reputation, bid.quality, bid.estimated_completion, spec.task_timeout);

  auction->bidders.insert(bid.worker_id);
  auction->bids.push_back(bid);
  ++bids_;
  observability::Metrics::Instance().RecordBidReceived();

  const size_t max_bids = spec.max_bids > 0 ? spec.max_bids : auction->invited.size();
  if (auction->bids.size() >= max_bids) {
    Resolve(*auction);
  }

  return {bid.id, bid.sequence, bid.score, auction->status};
}

uint32_t AuctionCoordinator::MinBidders(const Auction& auction) const {
  return auction.spec.min_bidders > 0 ? auction.spec.min_bidders : options_.min_bidders;
}

void AuctionCoordinator::Resolve(Auction& auction) {
  if (IsTerminal(auction.status)) {
    return;
  }
  auction.status = AUCTION_STATUS_CLOSED;

  const auto& eligible = auction.bids;
  if (eligible.empty()) {
    auction.status = AUCTION_STATUS_EXPIRED;
    ++expired_;
  } else if (eligible.size() < MinBidders(auction)) {
    auction.status = AUCTION_STATUS_INSUFFICIENT_BIDDERS;
    ++insufficient_;
  } else {
    const auto& winner   = *std::min_element(eligible.begin(), eligible.end(), BetterBid);
    auction.winning_bid  = winner;
    auction.final_price  = ClearingPrice(RuleFor(auction.spec.kind), winner, eligible, auction.spec.reserve_price);
    auction.status       = AUCTION_STATUS_AWARDED;
    ++awarded_;
    observability::Metrics::Instance().ObserveWinningPrice(auction.final_price);
  }
  auction.resolved_at = util::Now();

  observability::Metrics::Instance().RecordAuctionResolved(StatusName(auction.status));
  if (auction.status == AUCTION_STATUS_AWARDED) {
    MARKET_LOG_INFO("auction awarded",
                    {observability::StringField("auction_id", auction.id), observability::StringField("worker_id", auction.winning_bid->worker_id),
                     observability::DoubleField("final_price", auction.final_price),
                     observability::IntField("bids", static_cast<int64_t>(eligible.size()))});
  } else {
    MARKET_LOG_WARN("auction not awarded",
                    {observability::StringField("auction_id", auction.id), observability::StringField("status", StatusName(auction.status)),
                     observability::IntField("bids", static_cast<int64_t>(eligible.size())),
                     observability::IntField("min_bidders", MinBidders(auction))});
  }

  Persist(auction);
  auction.cv.notify_all();
}

void AuctionCoordinator::Persist(const Auction& auction) {
  if (!repository_) {
    return;
  }
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertAuction(*tx, ToRecord(auction.id, auction.spec, auction.status, auction.created_at, auction.expires_at,
                                                             auction.bids, auction.winning_bid, auction.final_price)),
                     "persist auction " + auction.id);
  tx->Commit();
}

AuctionSnapshot AuctionCoordinator::Snapshot(const Auction& auction) const {
  AuctionSnapshot snapshot;
  snapshot.id          = auction.id;
  snapshot.spec        = auction.spec;
  snapshot.status      = auction.status;
  snapshot.created_at  = auction.created_at;
  snapshot.expires_at  = auction.expires_at;
  snapshot.bids        = auction.bids;
  snapshot.winning_bid = auction.winning_bid;
  snapshot.final_price = auction.final_price;
  return snapshot;
}

AuctionSnapshot AuctionCoordinator::CloseAuction(const std::string& auction_id) {
  auto            auction = Find(auction_id);
  std::lock_guard lock(auction->mutex);
  Resolve(*auction);
  return Snapshot(*auction);
}

AuctionSnapshot AuctionCoordinator::CancelAuction(const std::string& auction_id) {
  auto            auction = Find(auction_id);
  std::lock_guard lock(auction->mutex);
  if (auction->status != AUCTION_STATUS_OPEN) {
    throw util::AuctionClosed("cannot cancel auction " + auction_id + " in status " + std::string(StatusName(auction->status)));
  }

  auction->status      = AUCTION_STATUS_CANCELED;
  auction->resolved_at = util::Now();
  ++canceled_;
  observability::Metrics::Instance().RecordAuctionResolved(StatusName(auction->status));
  MARKET_LOG_INFO("auction canceled", {observability::StringField("auction_id", auction_id)});

  Persist(*auction);
  auction->cv.notify_all();
  return Snapshot(*auction);
}

AuctionSnapshot AuctionCoordinator::GetAuction(const std::string& auction_id) const {
  {
    std::shared_lock lock(mutex_);
    if (auto it = auctions_.find(auction_id); it != auctions_.end()) {
      auto            auction = it->second;
      std::lock_guard auction_lock(auction->mutex);
      return Snapshot(*auction);
    }
  }

  if (repository_) {
    auto tx     = repository_->Begin();
    auto record = repository_->GetAuction(*tx, auction_id);
    tx->Commit();
    if (record) {
      return FromRecord(*record);
    }
  }
  throw util::NotFound("auction not found: " + auction_id);
}

std::optional<AuctionSnapshot> AuctionCoordinator::GetAuctionByTask(const std::string& task_id) const {
  std::string auction_id;
  {
    std::shared_lock lock(mutex_);
    auto             it = by_task_.find(task_id);
    if (it == by_task_.end()) {
      return std::nullopt;
    }
    auction_id = it->second;
  }
  return GetAuction(auction_id);
}

AuctionSnapshot AuctionCoordinator::AwaitOutcome(const std::string& auction_id) {
  auto             auction = Find(auction_id);
  std::unique_lock lock(auction->mutex);
  auction->cv.wait_until(lock, auction->expires_at, [&auction] { return IsTerminal(auction->status); });
  Resolve(*auction);
  return Snapshot(*auction);
}

size_t AuctionCoordinator::SweepOnce(util::TimePoint now) {
  std::vector<std::shared_ptr<Auction>> all;
  {
    std::shared_lock lock(mutex_);
    all.reserve(auctions_.size());
    for (const auto& [_, auction] : auctions_) {
      all.push_back(auction);
    }
  }

  size_t                   resolved = 0;
  std::vector<std::string> purge;
  for (const auto& auction : all) {
    std::lock_guard lock(auction->mutex);
    if (auction->status == AUCTION_STATUS_OPEN && now >= auction->expires_at) {
      Resolve(*auction);
      ++resolved;
    } else if (IsTerminal(auction->status) && now - auction->resolved_at >= options_.retention) {
      purge.push_back(auction->id);
    }
  }

  if (!purge.empty()) {
    std::unique_lock lock(mutex_);
    for (const auto& id : purge) {
      auto it = auctions_.find(id);
      if (it == auctions_.end()) continue;
      auto task = by_task_.find(it->second->spec.task_id);
      if (task != by_task_.end() && task->second == id) {
        by_task_.erase(task);
      }
      auctions_.erase(it);
    }
  }

  if (resolved > 0 || !purge.empty()) {
    MARKET_LOG_INFO("auction sweep", {observability::IntField("resolved", static_cast<int64_t>(resolved)),
                                      observability::IntField("purged", static_cast<int64_t>(purge.size()))});
  }
  return resolved;
}

void AuctionCoordinator::Start() {
  std::lock_guard lock(sweep_mutex_);
  if (sweeper_.joinable()) {
    return;
  }
  stop_requested_ = false;
  sweeper_        = std::thread(&AuctionCoordinator::Loop, this);
}

void AuctionCoordinator::Stop() {
  {
    std::lock_guard lock(sweep_mutex_);
    stop_requested_ = true;
  }
  sweep_cv_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

void AuctionCoordinator::Loop() {
  std::unique_lock lock(sweep_mutex_);
  while (!sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return stop_requested_; })) {
    lock.unlock();
    try {
      SweepOnce(util::Now());
    } catch (const std::exception& e) {
      MARKET_LOG_ERROR("auction sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

AuctionStats AuctionCoordinator::Stats() const {
  AuctionStats stats;
  stats.created      = created_;
  stats.bids         = bids_;
  stats.awarded      = awarded_;
  stats.insufficient = insufficient_;
  stats.expired      = expired_;
  stats.canceled     = canceled_;

  std::shared_lock lock(mutex_);
  for (const auto& [_, auction] : auctions_) {
    std::lock_guard auction_lock(auction->mutex);
    if (auction->status == AUCTION_STATUS_OPEN) ++stats.open;
  }
  return stats;
}

} // namespace market::auction
