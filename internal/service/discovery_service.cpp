#include "discovery_service.hpp"

#include "internal/clients/reputation_client.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace market::service {

using namespace market::v1;

DiscoveryService::DiscoveryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterWorkerResponse DiscoveryService::RegisterWorker(const RegisterWorkerRequest& req) {
  return ObserveRpc("DiscoveryService.RegisterWorker", [&] {
    if (!req.has_worker()) {
      throw util::InvalidArgument("register worker: worker is required");
    }
    auto record = FromProto(req.worker());
    if (record.id.empty()) {
      throw util::InvalidArgument("register worker: worker_id is required");
    }
    if (!ctx_.reputation) {
      throw util::Unavailable("register worker: no reputation service configured");
    }
    // The snapshot comes from the reputation service, never from the worker.
    record.reputation = ctx_.reputation->GetScore(record.id);

    RegisterWorkerResponse resp;
    *resp.mutable_worker() = ToProto(ctx_.index->Register(std::move(record)));
    return resp;
  });
}

UnregisterWorkerResponse DiscoveryService::UnregisterWorker(const UnregisterWorkerRequest& req) {
  return ObserveRpc("DiscoveryService.UnregisterWorker", [&] {
    ctx_.index->Unregister(req.worker_id());
    return UnregisterWorkerResponse{};
  });
}

UpdateWorkerStatusResponse DiscoveryService::UpdateWorkerStatus(const UpdateWorkerStatusRequest& req) {
  return ObserveRpc("DiscoveryService.UpdateWorkerStatus", [&] {
    if (req.status() == WORKER_STATUS_UNSPECIFIED) {
      throw util::InvalidArgument("update worker status: status is required");
    }
    UpdateWorkerStatusResponse resp;
    *resp.mutable_worker() = ToProto(ctx_.index->UpdateStatus(req.worker_id(), req.status()));
    return resp;
  });
}

DiscoverResponse DiscoveryService::Discover(const DiscoverRequest& req) {
  return ObserveRpc("DiscoveryService.Discover", [&] {
    DiscoverResponse resp;
    for (const auto& match : ctx_.index->Query(FromProto(req.query()))) {
      auto* out                = resp.add_matches();
      *out->mutable_worker()   = ToProto(match.worker);
      out->set_score(match.score);
    }
    return resp;
  });
}

} // namespace market::service
