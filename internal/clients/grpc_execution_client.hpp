#pragma once

#include <memory>
#include <string>

#include "internal/clients/execution_client.hpp"
#include "internal/clients/grpc_channel_cache.hpp"
#include "internal/discovery/capability_index.hpp"

namespace market::clients {

/*
  ExecutionRuntimeService over gRPC.

  With an empty runtime address the request goes to the winning worker's
  own endpoint.
*/
class GrpcExecutionClient final : public ExecutionClient {
 public:
  GrpcExecutionClient(std::string runtime_address, std::shared_ptr<discovery::CapabilityIndex> index);

  ExecutionReport Execute(const ExecutionRequest& request) override;

 private:
  std::string Target(const std::string& worker_id) const;

  std::string                                 runtime_address_;
  std::shared_ptr<discovery::CapabilityIndex> index_;
  GrpcChannelCache                            channels_;
};

} // namespace market::clients
