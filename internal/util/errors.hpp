#pragma once

#include <stdexcept>
#include <string>

namespace market::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Input validation: rejected before any state is touched.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidQuery : public InvalidArgument {
 public:
  explicit InvalidQuery(const std::string& msg) : InvalidArgument(msg) {
  }
};

class InvalidBid : public InvalidArgument {
 public:
  explicit InvalidBid(const std::string& msg) : InvalidArgument(msg) {
  }
};

class InvalidAmount : public InvalidArgument {
 public:
  explicit InvalidAmount(const std::string& msg) : InvalidArgument(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuctionClosed : public InvalidState {
 public:
  explicit AuctionClosed(const std::string& msg) : InvalidState(msg) {
  }
};

class AuctionExpired : public InvalidState {
 public:
  explicit AuctionExpired(const std::string& msg) : InvalidState(msg) {
  }
};

class ChannelClosed : public InvalidState {
 public:
  explicit ChannelClosed(const std::string& msg) : InvalidState(msg) {
  }
};

class ChannelFrozen : public InvalidState {
 public:
  explicit ChannelFrozen(const std::string& msg) : InvalidState(msg) {
  }
};

class NoEligibleWorkers : public std::runtime_error {
 public:
  explicit NoEligibleWorkers(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBidders : public std::runtime_error {
 public:
  explicit InsufficientBidders(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientFunds : public std::runtime_error {
 public:
  explicit InsufficientFunds(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientChannelBalance : public InsufficientFunds {
 public:
  explicit InsufficientChannelBalance(const std::string& msg) : InsufficientFunds(msg) {
  }
};

// Ledger imbalance. The affected channel is frozen before this is thrown.
class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Collaborator (execution runtime, transport, reputation) unreachable or failing.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace market::util
