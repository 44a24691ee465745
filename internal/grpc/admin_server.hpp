#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "market/v1.hpp"

namespace market::grpc {

class AdminServer final : public market::v1::MarketAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<market::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const market::v1::StatsRequest*, market::v1::StatsResponse*) override;

 private:
  std::shared_ptr<market::service::AdminService> service_;
};

} // namespace market::grpc
