#pragma once

#include "market/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class DiscoveryService {
 public:
  explicit DiscoveryService(ServiceContext ctx);

  market::v1::RegisterWorkerResponse     RegisterWorker(const market::v1::RegisterWorkerRequest& req);
  market::v1::UnregisterWorkerResponse   UnregisterWorker(const market::v1::UnregisterWorkerRequest& req);
  market::v1::UpdateWorkerStatusResponse UpdateWorkerStatus(const market::v1::UpdateWorkerStatusRequest& req);
  market::v1::DiscoverResponse           Discover(const market::v1::DiscoverRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace market::service
