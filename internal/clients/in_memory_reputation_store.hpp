#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/clients/reputation_client.hpp"

namespace market::clients {

/*
  In-process reputation store used when no reputation service is configured.
  Keeps the most recent updates (up to history_limit) for inspection.
*/
class InMemoryReputationStore final : public ReputationClient {
 public:
  struct Update {
    std::string worker_id;
    double      delta = 0.0;
    std::string reason;
  };

  static constexpr size_t kDefaultHistoryLimit = 1024;

  explicit InMemoryReputationStore(double initial_score = 50.0, size_t history_limit = kDefaultHistoryLimit);

  double GetScore(const std::string& worker_id) override;
  double UpdateScore(const std::string& worker_id, double delta, const std::string& reason) override;

  void                SetScore(const std::string& worker_id, double score);
  std::vector<Update> History() const;

 private:
  double initial_score_;
  size_t history_limit_;

  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, double> scores_;
  std::deque<Update>                      history_;
};

} // namespace market::clients
