#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "market/v1.hpp"

namespace market::clients {

struct ProbeResult {
  bool        ok = false;
  double      response_time_ms = 0.0;
  std::string error;
};

/*
  Delivery channel to workers.

  Broadcast hands an invite to the candidate set; bids come back through
  AuctionCoordinator::SubmitBid. Neither call may be made while holding
  a market lock.
*/
class WorkerTransport {
 public:
  virtual ~WorkerTransport() = default;

  virtual void Broadcast(const std::vector<std::string>& worker_ids, const market::v1::AuctionInvite& invite) = 0;

  virtual ProbeResult Probe(const std::string& worker_id, std::chrono::milliseconds timeout) = 0;
};

} // namespace market::clients
