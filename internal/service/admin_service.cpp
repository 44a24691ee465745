#include "admin_service.hpp"

#include "internal/auction/auction_coordinator.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/ledger/escrow_ledger.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace market::service {

using namespace market::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    StatsResponse resp;
    *resp.mutable_discovery() = ToProto(ctx_.index->Counts());
    *resp.mutable_auctions()  = ToProto(ctx_.auctions->Stats());
    *resp.mutable_ledger()    = ToProto(ctx_.ledger->Stats());
    return resp;
  });
}

} // namespace market::service
