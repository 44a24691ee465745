#include "grpc_channel_cache.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/observability/spans.hpp"

namespace market::clients {

std::shared_ptr<::grpc::Channel> GrpcChannelCache::Get(const std::string& target) {
  std::lock_guard lock(mutex_);
  auto&           channel = channels_[target];
  if (!channel) {
    channel = ::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials());
  }
  return channel;
}

void PrepareContext(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  if (timeout.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  }
  for (const auto& [key, value] : observability::CurrentTraceHeaders()) {
    ctx.AddMetadata(key, value);
  }
}

} // namespace market::clients
