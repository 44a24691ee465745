#include "grpc_worker_transport.hpp"

#include <grpcpp/client_context.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "market/agent_v1.hpp"

namespace market::clients {

GrpcWorkerTransport::GrpcWorkerTransport(std::shared_ptr<discovery::CapabilityIndex> index, std::chrono::milliseconds invite_timeout)
    : index_(std::move(index)), invite_timeout_(invite_timeout) {
}

std::string GrpcWorkerTransport::Endpoint(const std::string& worker_id) const {
  const auto worker = index_->Get(worker_id);
  if (!worker) {
    throw util::NotFound("worker not registered: " + worker_id);
  }
  if (worker->endpoint.empty()) {
    throw util::Unavailable("worker " + worker_id + " has no endpoint");
  }
  return worker->endpoint;
}

void GrpcWorkerTransport::Broadcast(const std::vector<std::string>& worker_ids, const market::v1::AuctionInvite& invite) {
  market::agent::v1::InviteRequest req;
  *req.mutable_invite() = invite;

  for (const auto& worker_id : worker_ids) {
    try {
      auto stub = market::agent::v1::WorkerAgentService::NewStub(channels_.Get(Endpoint(worker_id)));

      ::grpc::ClientContext              ctx;
      market::agent::v1::InviteResponse resp;
      PrepareContext(ctx, invite_timeout_);
      const auto status = stub->Invite(&ctx, req, &resp);
      if (!status.ok()) {
        MARKET_LOG_WARN("auction invite failed",
                        {observability::StringField("worker_id", worker_id), observability::StringField("auction_id", invite.auction_id()),
                         observability::StringField("error", status.error_message())});
      } else if (!resp.accepted()) {
        MARKET_LOG_INFO("auction invite declined",
                        {observability::StringField("worker_id", worker_id), observability::StringField("auction_id", invite.auction_id())});
      }
    } catch (const std::exception& e) {
      MARKET_LOG_WARN("auction invite skipped",
                      {observability::StringField("worker_id", worker_id), observability::StringField("error", e.what())});
    }
  }
}

ProbeResult GrpcWorkerTransport::Probe(const std::string& worker_id, std::chrono::milliseconds timeout) {
  auto stub = market::agent::v1::WorkerAgentService::NewStub(channels_.Get(Endpoint(worker_id)));

  market::agent::v1::PingRequest req;
  req.set_worker_id(worker_id);

  ::grpc::ClientContext            ctx;
  market::agent::v1::PingResponse resp;
  PrepareContext(ctx, timeout);

  const auto started = std::chrono::steady_clock::now();
  const auto status  = stub->Ping(&ctx, req, &resp);
  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

  if (!status.ok()) {
    return {false, elapsed, status.error_message()};
  }
  if (!resp.worker_id().empty() && resp.worker_id() != worker_id) {
    return {false, elapsed, "endpoint answered as " + resp.worker_id()};
  }
  return {true, elapsed, {}};
}

} // namespace market::clients
