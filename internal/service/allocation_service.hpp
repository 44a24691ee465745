#pragma once

#include "market/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class AllocationService {
 public:
  explicit AllocationService(ServiceContext ctx);

  market::v1::AllocateAndSettleResponse AllocateAndSettle(const market::v1::AllocateAndSettleRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace market::service
