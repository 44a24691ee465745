#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/ledger/escrow_ledger.hpp"

namespace market::settlement {

struct ReaperOptions {
  std::chrono::milliseconds interval{60'000};
};

/*
  Background refund of escrow holds past their hold deadline.

  Channels left with no active hold are closed so the payer gets the
  funds back without waiting for the execution that never reported.
*/
class EscrowReaper {
 public:
  EscrowReaper(std::shared_ptr<ledger::EscrowLedger> ledger, ReaperOptions options = {});
  ~EscrowReaper();

  EscrowReaper(const EscrowReaper&)            = delete;
  EscrowReaper& operator=(const EscrowReaper&) = delete;

  void Start();
  void Stop();

  // Returns the number of holds refunded.
  size_t RunOnce(util::TimePoint now);

  bool Running() const {
    return running_;
  }

 private:
  void Loop();

  std::shared_ptr<ledger::EscrowLedger> ledger_;
  ReaperOptions                         options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace market::settlement
