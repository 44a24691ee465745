#include "auction_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

AuctionServer::AuctionServer(std::shared_ptr<market::service::AuctionService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuctionServer::CreateAuction(::grpc::ServerContext*, const market::v1::CreateAuctionRequest* req, market::v1::CreateAuctionResponse* resp) {
  try {
    *resp = service_->CreateAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::SubmitBid(::grpc::ServerContext*, const market::v1::SubmitBidRequest* req, market::v1::SubmitBidResponse* resp) {
  try {
    *resp = service_->SubmitBid(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::GetAuctionStatus(::grpc::ServerContext*, const market::v1::GetAuctionStatusRequest* req, market::v1::GetAuctionStatusResponse* resp) {
  try {
    *resp = service_->GetAuctionStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::CancelAuction(::grpc::ServerContext*, const market::v1::CancelAuctionRequest* req, market::v1::CancelAuctionResponse* resp) {
  try {
    *resp = service_->CancelAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
