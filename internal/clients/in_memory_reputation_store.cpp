#include "in_memory_reputation_store.hpp"

#include <algorithm>

namespace market::clients {

InMemoryReputationStore::InMemoryReputationStore(double initial_score, size_t history_limit)
    : initial_score_(initial_score), history_limit_(history_limit) {
}

double InMemoryReputationStore::GetScore(const std::string& worker_id) {
  std::lock_guard lock(mutex_);
  auto            it = scores_.find(worker_id);
  return it == scores_.end() ? initial_score_ : it->second;
}

double InMemoryReputationStore::UpdateScore(const std::string& worker_id, double delta, const std::string& reason) {
  std::lock_guard lock(mutex_);
  auto it   = scores_.try_emplace(worker_id, initial_score_).first;
  it->second = std::clamp(it->second + delta, 0.0, 100.0);
  if (history_limit_ > 0) {
    if (history_.size() == history_limit_) {
      history_.pop_front();
    }
    history_.push_back({worker_id, delta, reason});
  }
  return it->second;
}

void InMemoryReputationStore::SetScore(const std::string& worker_id, double score) {
  std::lock_guard lock(mutex_);
  scores_[worker_id] = std::clamp(score, 0.0, 100.0);
}

std::vector<InMemoryReputationStore::Update> InMemoryReputationStore::History() const {
  std::lock_guard lock(mutex_);
  return {history_.begin(), history_.end()};
}

} // namespace market::clients
