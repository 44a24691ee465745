#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/allocation_service.hpp"
#include "market/v1.hpp"

namespace market::grpc {

class AllocationServer final : public market::v1::MarketAllocationService::Service {
 public:
  explicit AllocationServer(std::shared_ptr<market::service::AllocationService> svc);

  ::grpc::Status AllocateAndSettle(::grpc::ServerContext*, const market::v1::AllocateAndSettleRequest*, market::v1::AllocateAndSettleResponse*) override;

 private:
  std::shared_ptr<market::service::AllocationService> service_;
};

} // namespace market::grpc
