#include "discovery_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

DiscoveryServer::DiscoveryServer(std::shared_ptr<market::service::DiscoveryService> svc) : service_(std::move(svc)) {
}

::grpc::Status DiscoveryServer::RegisterWorker(::grpc::ServerContext*, const market::v1::RegisterWorkerRequest* req, market::v1::RegisterWorkerResponse* resp) {
  try {
    *resp = service_->RegisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DiscoveryServer::UnregisterWorker(::grpc::ServerContext*, const market::v1::UnregisterWorkerRequest* req, market::v1::UnregisterWorkerResponse* resp) {
  try {
    *resp = service_->UnregisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DiscoveryServer::UpdateWorkerStatus(::grpc::ServerContext*, const market::v1::UpdateWorkerStatusRequest* req, market::v1::UpdateWorkerStatusResponse* resp) {
  try {
    *resp = service_->UpdateWorkerStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DiscoveryServer::Discover(::grpc::ServerContext*, const market::v1::DiscoverRequest* req, market::v1::DiscoverResponse* resp) {
  try {
    *resp = service_->Discover(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
