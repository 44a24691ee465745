#pragma once

#include "market/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class AuctionService {
 public:
  explicit AuctionService(ServiceContext ctx);

  // An empty candidate list is filled from discovery.
  market::v1::CreateAuctionResponse    CreateAuction(const market::v1::CreateAuctionRequest& req);
  market::v1::SubmitBidResponse        SubmitBid(const market::v1::SubmitBidRequest& req);
  market::v1::GetAuctionStatusResponse GetAuctionStatus(const market::v1::GetAuctionStatusRequest& req);
  market::v1::CancelAuctionResponse    CancelAuction(const market::v1::CancelAuctionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace market::service
