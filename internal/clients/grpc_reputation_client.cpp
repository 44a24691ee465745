#include "grpc_reputation_client.hpp"

#include <grpcpp/client_context.h>

#include "internal/clients/grpc_channel_cache.hpp"
#include "internal/util/errors.hpp"

namespace market::clients {

namespace {

void Check(const ::grpc::Status& status, const std::string& action) {
  if (!status.ok()) {
    throw util::Unavailable(action + " failed: " + status.error_message());
  }
}

} // namespace

GrpcReputationClient::GrpcReputationClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(market::agent::v1::ReputationService::NewStub(channel)), timeout_(timeout) {
}

double GrpcReputationClient::GetScore(const std::string& worker_id) {
  market::agent::v1::GetScoreRequest req;
  req.set_worker_id(worker_id);

  ::grpc::ClientContext ctx;
  PrepareContext(ctx, timeout_);
  market::agent::v1::GetScoreResponse resp;
  Check(stub_->GetScore(&ctx, req, &resp), "reputation GetScore " + worker_id);
  return resp.score();
}

double GrpcReputationClient::UpdateScore(const std::string& worker_id, double delta, const std::string& reason) {
  market::agent::v1::UpdateScoreRequest req;
  req.set_worker_id(worker_id);
  req.set_delta(delta);
  req.set_reason(reason);

  ::grpc::ClientContext ctx;
  PrepareContext(ctx, timeout_);
  market::agent::v1::UpdateScoreResponse resp;
  Check(stub_->UpdateScore(&ctx, req, &resp), "reputation UpdateScore " + worker_id);
  return resp.score();
}

} // namespace market::clients
