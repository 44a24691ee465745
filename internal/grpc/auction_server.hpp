#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/auction_service.hpp"
#include "market/v1.hpp"

namespace market::grpc {

class AuctionServer final : public market::v1::MarketAuctionService::Service {
 public:
  explicit AuctionServer(std::shared_ptr<market::service::AuctionService> svc);

  ::grpc::Status CreateAuction(::grpc::ServerContext*, const market::v1::CreateAuctionRequest*, market::v1::CreateAuctionResponse*) override;
  ::grpc::Status SubmitBid(::grpc::ServerContext*, const market::v1::SubmitBidRequest*, market::v1::SubmitBidResponse*) override;
  ::grpc::Status GetAuctionStatus(::grpc::ServerContext*, const market::v1::GetAuctionStatusRequest*, market::v1::GetAuctionStatusResponse*) override;
  ::grpc::Status CancelAuction(::grpc::ServerContext*, const market::v1::CancelAuctionRequest*, market::v1::CancelAuctionResponse*) override;

 private:
  std::shared_ptr<market::service::AuctionService> service_;
};

} // namespace market::grpc
