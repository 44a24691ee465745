#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/discovery_service.hpp"
#include "market/v1.hpp"

namespace market::grpc {

class DiscoveryServer final : public market::v1::MarketDiscoveryService::Service {
 public:
  explicit DiscoveryServer(std::shared_ptr<market::service::DiscoveryService> svc);

  ::grpc::Status RegisterWorker(::grpc::ServerContext*, const market::v1::RegisterWorkerRequest*, market::v1::RegisterWorkerResponse*) override;
  ::grpc::Status UnregisterWorker(::grpc::ServerContext*, const market::v1::UnregisterWorkerRequest*, market::v1::UnregisterWorkerResponse*) override;
  ::grpc::Status UpdateWorkerStatus(::grpc::ServerContext*, const market::v1::UpdateWorkerStatusRequest*, market::v1::UpdateWorkerStatusResponse*) override;
  ::grpc::Status Discover(::grpc::ServerContext*, const market::v1::DiscoverRequest*, market::v1::DiscoverResponse*) override;

 private:
  std::shared_ptr<market::service::DiscoveryService> service_;
};

} // namespace market::grpc
