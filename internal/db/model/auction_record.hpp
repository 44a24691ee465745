#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace market::db::model {

struct BidRecord {
  std::string bid_id;
  std::string worker_id;
  double      price                   = 0.0;
  uint64_t    estimated_completion_ms = 0;
  double      reputation              = 0.0;
  double      quality                 = 0.0;
  uint64_t    sequence                = 0;
  uint64_t    submitted_at_ms         = 0;
  double      score                   = 0.0;
};

/*
  Durable auction snapshot. Written on creation and again on resolution.
*/
struct AuctionRecord {
  std::string id;
  std::string task_id;
  std::string requester_id;
  int32_t     kind   = 0; // market::v1::AuctionKind
  int32_t     status = 0; // market::v1::AuctionStatus

  double   reserve_price = 0.0;
  double   max_price     = 0.0;
  double   final_price   = 0.0;
  std::string winning_bid_id;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;

  std::vector<BidRecord> bids;
};

} // namespace market::db::model
