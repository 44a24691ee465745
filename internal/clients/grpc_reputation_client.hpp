#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/clients/reputation_client.hpp"
#include "market/agent_v1.hpp"

namespace market::clients {

// ReputationService over gRPC. Failed calls throw util::Unavailable.
class GrpcReputationClient final : public ReputationClient {
 public:
  GrpcReputationClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  double GetScore(const std::string& worker_id) override;
  double UpdateScore(const std::string& worker_id, double delta, const std::string& reason) override;

 private:
  std::unique_ptr<market::agent::v1::ReputationService::Stub> stub_;
  std::chrono::milliseconds                                    timeout_;
};

} // namespace market::clients
