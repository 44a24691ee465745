#pragma once

#include <chrono>
#include <string>

#include "internal/clients/execution_client.hpp"

namespace market::settlement {

enum class FailurePenaltyMode {
  kFlat,
  // Scaled down by the fraction of work the worker completed.
  kProportional,
};

struct ReputationPolicyOptions {
  double             success_delta        = 2.0;
  double             efficiency_bonus     = 1.0;
  // Fraction of the task timeout under which the bonus applies.
  double             efficiency_threshold = 0.5;
  double             failure_penalty      = 5.0;
  FailurePenaltyMode failure_mode         = FailurePenaltyMode::kFlat;
};

struct ReputationChange {
  double      delta = 0.0;
  std::string reason;
};

class ReputationPolicy {
 public:
  explicit ReputationPolicy(ReputationPolicyOptions options = {});

  ReputationChange Evaluate(bool success, const clients::ExecutionReport& report, std::chrono::milliseconds timeout) const;

  const ReputationPolicyOptions& Options() const {
    return options_;
  }

 private:
  ReputationPolicyOptions options_;
};

} // namespace market::settlement
