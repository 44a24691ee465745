#pragma once

#include <string>

namespace market::clients {

/*
  Reputation scores are on a 0..100 scale.
*/
class ReputationClient {
 public:
  virtual ~ReputationClient() = default;

  virtual double GetScore(const std::string& worker_id) = 0;

  // Returns the score after the update.
  virtual double UpdateScore(const std::string& worker_id, double delta, const std::string& reason) = 0;
};

} // namespace market::clients
