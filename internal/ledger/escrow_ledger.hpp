#pragma once

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/ledger_types.hpp"

namespace market::ledger {

struct LedgerOptions {
#ifdef NDEBUG
  bool verify_after_mutation = false;
#else
  bool verify_after_mutation = true;
#endif
  std::chrono::milliseconds max_escrow_hold{3'600'000};
};

/*
  EscrowLedger

  Accounts and payment channels. Nothing else in the process changes a
  balance.

  Locking:
    mutex_               shared for lookups, exclusive for new entities
    audit_mutex_         shared by every mutation, exclusive for VerifyAll
    ChannelSlot::mutex   one channel
    AccountSlot::mutex   one account

  A mutation takes its channel lock first and then the account locks it
  needs (two accounts are locked together with std::scoped_lock). No path
  takes an account lock and then a channel lock.

  Each mutation is applied to a copy, checked, written through to the
  repository and only then swapped in, so a failed write leaves memory
  unchanged.
*/
class EscrowLedger {
 public:
  explicit EscrowLedger(std::shared_ptr<db::Repository> repository = nullptr, LedgerOptions options = {});

  EscrowLedger(const EscrowLedger&)            = delete;
  EscrowLedger& operator=(const EscrowLedger&) = delete;

  // Replaces in-memory state with the repository contents.
  void Hydrate();

  Account Deposit(const std::string& owner_id, Micros amount);
  Account Withdraw(const std::string& owner_id, Micros amount);

  // 0 for unknown owners.
  Micros                 GetBalance(const std::string& owner_id) const;
  std::optional<Account> GetAccount(const std::string& owner_id) const;

  Channel OpenChannel(const std::string& payer_id, const std::string& payee_id, Micros deposit, const std::string& auction_ref);

  Channel LockEscrow(const std::string& channel_id, const std::string& task_id, Micros amount);

  // Exactly-once per (channel, task). Repeated calls return the first
  // result with already_released set.
  ReleaseResult ReleaseEscrow(const std::string& channel_id, const std::string& task_id, bool success, std::string_view reason = {});

  // Refunds the remaining balance to the payer.
  Channel CloseChannel(const std::string& channel_id);

  // Refunds active holds whose deadline is at or before now.
  std::vector<ReleaseResult> ExpireStaleEscrows(util::TimePoint now);

  // Throw InvariantViolation; a violating channel is frozen first.
  void VerifyInvariant(const std::string& channel_id);
  void VerifyAccount(const std::string& owner_id);
  // Every channel and account plus ledger-wide conservation. Waits for
  // in-flight mutations and blocks new ones while it runs.
  void VerifyAll();

  Channel                  GetChannel(const std::string& channel_id) const;
  std::vector<Channel>     ListChannels() const;
  std::vector<LedgerEntry> TransactionHistory(const std::string& owner_id) const;

  LedgerStats Stats() const;

  const LedgerOptions& Options() const {
    return options_;
  }

 private:
  struct AccountSlot {
    std::mutex mutex;
    Account    account;
  };

  struct ChannelSlot {
    std::mutex mutex;
    Channel    channel;
  };

  std::shared_ptr<AccountSlot> FindAccount(const std::string& owner_id) const;
  std::shared_ptr<AccountSlot> AccountFor(const std::string& owner_id);
  std::shared_ptr<ChannelSlot> FindChannel(const std::string& channel_id) const;

  std::optional<std::string> ChannelViolation(const Channel& channel) const;
  std::optional<std::string> AccountViolation(const Account& account) const;

  // Require the slot mutex.
  void VerifyBefore(ChannelSlot& slot, std::string_view op);
  void VerifyAfter(ChannelSlot& slot, const Channel& next, std::string_view op);
  void VerifyAfter(const Account& next, std::string_view op);
  [[noreturn]] void Freeze(ChannelSlot& slot, const std::string& detail);

  ReleaseResult ReleaseLocked(ChannelSlot& slot, const std::string& task_id, bool success, std::string_view reason);

  void Persist(const Channel* channel, const LedgerEntry* entry, std::initializer_list<const Account*> accounts);

  std::shared_ptr<db::Repository> repository_;
  LedgerOptions                   options_;

  mutable std::shared_mutex                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<AccountSlot>> accounts_;
  std::unordered_map<std::string, std::shared_ptr<ChannelSlot>> channels_;
  std::unordered_map<std::string, std::vector<std::string>>     channels_by_owner_;

  std::shared_mutex audit_mutex_;

  std::atomic<uint64_t> channels_opened_{0};
  std::atomic<uint64_t> channels_closed_{0};
  std::atomic<Micros>   escrow_locked_{0};
  std::atomic<Micros>   escrow_released_{0};
  std::atomic<Micros>   escrow_refunded_{0};
  std::atomic<uint64_t> invariant_violations_{0};
};

} // namespace market::ledger
