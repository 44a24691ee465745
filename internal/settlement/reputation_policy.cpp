#include "reputation_policy.hpp"

#include <algorithm>

namespace market::settlement {

ReputationPolicy::ReputationPolicy(ReputationPolicyOptions options) : options_(options) {
}

ReputationChange ReputationPolicy::Evaluate(bool success, const clients::ExecutionReport& report, std::chrono::milliseconds timeout) const {
  ReputationChange change;

  if (success) {
    change.delta  = options_.success_delta;
    change.reason = "task succeeded";

    const auto threshold_ms = options_.efficiency_threshold * static_cast<double>(timeout.count());
    if (timeout.count() > 0 && static_cast<double>(report.duration.count()) <= threshold_ms) {
      change.delta += options_.efficiency_bonus;
      change.reason = "task succeeded efficiently";
    }
    return change;
  }

  if (options_.failure_mode == FailurePenaltyMode::kProportional) {
    const double progress = std::clamp(report.progress, 0.0, 1.0);
    change.delta          = -options_.failure_penalty * (1.0 - progress);
  } else {
    change.delta = -options_.failure_penalty;
  }
  change.reason = report.timed_out ? "task timed out" : "task failed";
  return change;
}

} // namespace market::settlement
