#include "auction_service.hpp"

#include "internal/auction/auction_coordinator.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace market::service {

using namespace market::v1;

AuctionService::AuctionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateAuctionResponse AuctionService::CreateAuction(const CreateAuctionRequest& req) {
  return ObserveRpc("AuctionService.CreateAuction", [&] {
    if (!req.has_spec()) {
      throw util::InvalidArgument("create auction: spec is required");
    }
    auto spec = FromProto(req.spec());
    if (spec.duration.count() == 0) {
      spec.duration = ctx_.auctions->Options().default_duration;
    }

    if (spec.candidate_ids.empty()) {
      discovery::DiscoveryQuery query;
      query.capabilities   = spec.capabilities;
      query.min_reputation = spec.min_reputation;
      for (const auto& match : ctx_.index->Query(query)) {
        spec.candidate_ids.push_back(match.worker.id);
      }
    }

    CreateAuctionResponse resp;
    resp.set_auction_id(ctx_.auctions->CreateAuction(std::move(spec)));
    return resp;
  });
}

SubmitBidResponse AuctionService::SubmitBid(const SubmitBidRequest& req) {
  return ObserveRpc("AuctionService.SubmitBid", [&] {
    auction::BidSubmission bid;
    bid.worker_id            = req.worker_id();
    bid.price                = req.price();
    bid.estimated_completion = std::chrono::milliseconds(req.estimated_completion_ms());
    bid.reputation           = req.reputation();
    bid.quality              = req.quality();

    const auto        ack = ctx_.auctions->SubmitBid(req.auction_id(), bid);
    SubmitBidResponse resp;
    resp.set_bid_id(ack.bid_id);
    resp.set_sequence(ack.sequence);
    resp.set_score(ack.score);
    resp.set_status(ack.status);
    return resp;
  });
}

GetAuctionStatusResponse AuctionService::GetAuctionStatus(const GetAuctionStatusRequest& req) {
  return ObserveRpc("AuctionService.GetAuctionStatus", [&] {
    GetAuctionStatusResponse resp;
    *resp.mutable_auction() = ToProto(ctx_.auctions->GetAuction(req.auction_id()));
    return resp;
  });
}

CancelAuctionResponse AuctionService::CancelAuction(const CancelAuctionRequest& req) {
  return ObserveRpc("AuctionService.CancelAuction", [&] {
    CancelAuctionResponse resp;
    *resp.mutable_auction() = ToProto(ctx_.auctions->CancelAuction(req.auction_id()));
    return resp;
  });
}

} // namespace market::service
