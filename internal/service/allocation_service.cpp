#include "allocation_service.hpp"

#include "internal/core/marketplace_orchestrator.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace market::service {

using namespace market::v1;

AllocationService::AllocationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AllocateAndSettleResponse AllocationService::AllocateAndSettle(const AllocateAndSettleRequest& req) {
  return ObserveRpc("AllocationService.AllocateAndSettle", [&] {
    if (!req.has_task()) {
      throw util::InvalidArgument("allocate: task is required");
    }
    AllocateAndSettleResponse resp;
    *resp.mutable_result() = ctx_.orchestrator->AllocateAndSettle(req.task());
    return resp;
  });
}

} // namespace market::service
