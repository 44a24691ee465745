#pragma once

#include "market/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  market::v1::StatsResponse Stats(const market::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace market::service
