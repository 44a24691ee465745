#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

AdminServer::AdminServer(std::shared_ptr<market::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const market::v1::StatsRequest* req, market::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
