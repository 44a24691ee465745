#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace market::clients {

struct ExecutionRequest {
  std::string               task_id;
  std::string               worker_id;
  std::vector<std::string>  capabilities;
  std::string               input;
  std::chrono::milliseconds timeout{0};
};

struct ExecutionReport {
  bool                      success = false;
  bool                      timed_out = false;
  int64_t                   cost_micros = 0;
  std::chrono::milliseconds duration{0};
  // Fraction of the work completed, 0..1.
  double      progress = 0.0;
  std::string error;
};

class ExecutionClient {
 public:
  virtual ~ExecutionClient() = default;

  // May throw; callers map exceptions to a failed report.
  virtual ExecutionReport Execute(const ExecutionRequest& request) = 0;
};

} // namespace market::clients
