#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace market::clients {

// One insecure channel per target, created on first use.
class GrpcChannelCache {
 public:
  std::shared_ptr<::grpc::Channel> Get(const std::string& target);

 private:
  std::mutex                                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<::grpc::Channel>> channels_;
};

// Applies the deadline (none when timeout is zero) and forwards the active
// trace context as call metadata.
void PrepareContext(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout);

} // namespace market::clients
