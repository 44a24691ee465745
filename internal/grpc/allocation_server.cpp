#include "allocation_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

AllocationServer::AllocationServer(std::shared_ptr<market::service::AllocationService> svc) : service_(std::move(svc)) {
}

::grpc::Status AllocationServer::AllocateAndSettle(::grpc::ServerContext*, const market::v1::AllocateAndSettleRequest* req, market::v1::AllocateAndSettleResponse* resp) {
  try {
    *resp = service_->AllocateAndSettle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
