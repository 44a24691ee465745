#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "market/v1.hpp"

namespace market::auction {

struct AuctionSpec {
  std::string              task_id;
  std::string              requester_id;
  market::v1::AuctionKind  kind = market::v1::AUCTION_KIND_UNSPECIFIED; // unspecified = coordinator default
  std::vector<std::string> capabilities;

  double reserve_price  = 0.0;
  double max_price      = 0.0;
  double min_reputation = 0.0;

  std::chrono::milliseconds duration{0};
  std::chrono::milliseconds task_timeout{0}; // 0 = speed not scored

  uint32_t max_bids    = 0; // 0 = number of candidates
  uint32_t min_bidders = 0; // 0 = coordinator default

  std::vector<std::string> candidate_ids;
};

// What a worker sends. Reputation and quality are overridden by the index
// snapshot when the worker is registered there.
struct BidSubmission {
  std::string               worker_id;
  double                    price = 0.0;
  std::chrono::milliseconds estimated_completion{0};
  double                    reputation = 0.0;
  double                    quality    = 0.0;
};

struct Bid {
  std::string               id;
  std::string               auction_id;
  std::string               worker_id;
  double                    price = 0.0;
  std::chrono::milliseconds estimated_completion{0};
  double                    reputation = 0.0;
  double                    quality    = 0.0;
  uint64_t                  sequence   = 0;
  util::TimePoint           submitted_at{};
  double                    score = 0.0;
};

struct BidAck {
  std::string               bid_id;
  uint64_t                  sequence = 0;
  double                    score    = 0.0;
  market::v1::AuctionStatus status   = market::v1::AUCTION_STATUS_OPEN;
};

struct AuctionSnapshot {
  std::string               id;
  AuctionSpec               spec;
  market::v1::AuctionStatus status = market::v1::AUCTION_STATUS_UNSPECIFIED;
  util::TimePoint           created_at{};
  util::TimePoint           expires_at{};
  std::vector<Bid>          bids;
  std::optional<Bid>        winning_bid;
  double                    final_price = 0.0;
};

struct AuctionStats {
  uint64_t created      = 0;
  uint64_t bids         = 0;
  uint64_t awarded      = 0;
  uint64_t insufficient = 0;
  uint64_t expired      = 0;
  uint64_t canceled     = 0;
  uint64_t open         = 0;
};

inline bool IsTerminal(market::v1::AuctionStatus status) {
  return status == market::v1::AUCTION_STATUS_AWARDED || status == market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS ||
         status == market::v1::AUCTION_STATUS_EXPIRED || status == market::v1::AUCTION_STATUS_CANCELED;
}

} // namespace market::auction
