#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/auction/auction_types.hpp"
#include "internal/clients/worker_transport.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/discovery/capability_index.hpp"

namespace market::auction {

struct AuctionOptions {
  market::v1::AuctionKind   default_kind = market::v1::AUCTION_KIND_SECOND_PRICE;
  std::chrono::milliseconds default_duration{30'000};
  std::chrono::milliseconds sweep_interval{10'000};
  std::chrono::milliseconds retention{300'000};
  uint32_t                  min_bidders = 3;
};

/*
  AuctionCoordinator

  Runs sealed-bid procurement auctions for one task each.

  Locking:
    mutex_           shared for lookups, exclusive for insert/purge
    Auction::mutex   everything about one auction (bids, status)

  The invite broadcast and index lookups happen with no auction lock held,
  so a transport may deliver bids synchronously from inside Broadcast().
  Resolution runs exactly once per auction under its mutex; waiters in
  AwaitOutcome() are woken through Auction::cv.
*/
class AuctionCoordinator {
 public:
  AuctionCoordinator(std::shared_ptr<clients::WorkerTransport> transport, std::shared_ptr<db::Repository> repository = nullptr,
                     std::shared_ptr<discovery::CapabilityIndex> index = nullptr, AuctionOptions options = {});
  ~AuctionCoordinator();

  AuctionCoordinator(const AuctionCoordinator&)            = delete;
  AuctionCoordinator& operator=(const AuctionCoordinator&) = delete;

  std::string CreateAuction(AuctionSpec spec);

  BidAck SubmitBid(const std::string& auction_id, const BidSubmission& submission);

  // Close and resolve now. Terminal auctions are returned unchanged.
  AuctionSnapshot CloseAuction(const std::string& auction_id);

  AuctionSnapshot CancelAuction(const std::string& auction_id);

  // Falls back to the repository for auctions purged from memory.
  AuctionSnapshot                GetAuction(const std::string& auction_id) const;
  std::optional<AuctionSnapshot> GetAuctionByTask(const std::string& task_id) const;

  // Blocks until the auction is terminal; resolves it at its expiry.
  AuctionSnapshot AwaitOutcome(const std::string& auction_id);

  // Resolves overdue auctions and purges terminal ones past retention.
  // Returns the number resolved.
  size_t SweepOnce(util::TimePoint now);

  void Start();
  void Stop();

  AuctionStats Stats() const;

  const AuctionOptions& Options() const {
    return options_;
  }

 private:
  struct Auction {
    std::mutex              mutex;
    std::condition_variable cv;

    std::string               id;
    AuctionSpec               spec;
    market::v1::AuctionStatus status = market::v1::AUCTION_STATUS_OPEN;
    util::TimePoint           created_at{};
    util::TimePoint           expires_at{};
    util::TimePoint           resolved_at{};

    std::unordered_set<std::string> invited;
    std::unordered_set<std::string> bidders;
    std::vector<Bid>                bids;
    std::optional<Bid>              winning_bid;
    double                          final_price = 0.0;
  };

  std::shared_ptr<Auction> Find(const std::string& auction_id) const;

  // Requires auction.mutex.
  void            Resolve(Auction& auction);
  void            Persist(const Auction& auction);
  AuctionSnapshot Snapshot(const Auction& auction) const;
  uint32_t        MinBidders(const Auction& auction) const;

  void Loop();

  std::shared_ptr<clients::WorkerTransport>   transport_;
  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<discovery::CapabilityIndex> index_;
  AuctionOptions                              options_;

  mutable std::shared_mutex                                 mutex_;
  std::unordered_map<std::string, std::shared_ptr<Auction>> auctions_;
  std::unordered_map<std::string, std::string>              by_task_;

  std::atomic<uint64_t> created_{0};
  std::atomic<uint64_t> bids_{0};
  std::atomic<uint64_t> awarded_{0};
  std::atomic<uint64_t> insufficient_{0};
  std::atomic<uint64_t> expired_{0};
  std::atomic<uint64_t> canceled_{0};

  std::mutex              sweep_mutex_;
  std::condition_variable sweep_cv_;
  bool                    stop_requested_ = false;
  std::thread             sweeper_;
};

} // namespace market::auction
