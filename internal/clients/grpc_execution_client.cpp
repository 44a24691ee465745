#include "grpc_execution_client.hpp"

#include <grpcpp/client_context.h>

#include "internal/util/errors.hpp"
#include "market/agent_v1.hpp"

namespace market::clients {

GrpcExecutionClient::GrpcExecutionClient(std::string runtime_address, std::shared_ptr<discovery::CapabilityIndex> index)
    : runtime_address_(std::move(runtime_address)), index_(std::move(index)) {
}

std::string GrpcExecutionClient::Target(const std::string& worker_id) const {
  if (!runtime_address_.empty()) {
    return runtime_address_;
  }
  const auto worker = index_ ? index_->Get(worker_id) : std::nullopt;
  if (!worker || worker->endpoint.empty()) {
    throw util::Unavailable("no execution endpoint for worker " + worker_id);
  }
  return worker->endpoint;
}

ExecutionReport GrpcExecutionClient::Execute(const ExecutionRequest& request) {
  auto stub = market::agent::v1::ExecutionRuntimeService::NewStub(channels_.Get(Target(request.worker_id)));

  market::agent::v1::ExecuteRequest req;
  req.set_task_id(request.task_id);
  req.set_worker_id(request.worker_id);
  for (const auto& capability : request.capabilities) {
    req.add_capabilities(capability);
  }
  req.set_input(request.input);
  req.set_timeout_ms(static_cast<uint64_t>(request.timeout.count()));

  ::grpc::ClientContext ctx;
  PrepareContext(ctx, request.timeout);

  market::agent::v1::ExecuteResponse resp;
  const auto                         started = std::chrono::steady_clock::now();
  const auto                         status  = stub->Execute(&ctx, req, &resp);

  ExecutionReport report;
  if (status.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED) {
    report.timed_out = true;
    report.duration  = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    report.error     = "execution deadline exceeded";
    return report;
  }
  if (!status.ok()) {
    throw util::Unavailable("execute " + request.task_id + " failed: " + status.error_message());
  }

  report.success     = resp.success();
  report.cost_micros = resp.cost_micros();
  report.duration    = std::chrono::milliseconds(resp.duration_ms());
  report.progress    = resp.progress();
  report.error       = resp.error();
  return report;
}

} // namespace market::clients
