#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/clients/grpc_channel_cache.hpp"
#include "internal/clients/worker_transport.hpp"
#include "internal/discovery/capability_index.hpp"

namespace market::clients {

/*
  WorkerAgentService over gRPC. Worker endpoints come from the index.

  Broadcast is best effort: an unreachable worker is logged and skipped,
  the auction simply sees no bid from it.
*/
class GrpcWorkerTransport final : public WorkerTransport {
 public:
  GrpcWorkerTransport(std::shared_ptr<discovery::CapabilityIndex> index, std::chrono::milliseconds invite_timeout);

  void Broadcast(const std::vector<std::string>& worker_ids, const market::v1::AuctionInvite& invite) override;

  ProbeResult Probe(const std::string& worker_id, std::chrono::milliseconds timeout) override;

 private:
  std::string Endpoint(const std::string& worker_id) const;

  std::shared_ptr<discovery::CapabilityIndex> index_;
  std::chrono::milliseconds                   invite_timeout_;
  GrpcChannelCache                            channels_;
};

} // namespace market::clients
