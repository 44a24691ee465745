#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/ledger/money.hpp"
#include "internal/util/time.hpp"
#include "market/v1.hpp"

namespace market::ledger {

struct Account {
  std::string owner_id;
  Micros      balance   = 0;
  Micros      deposited = 0;
  Micros      withdrawn = 0;
  Micros      earned    = 0;
  Micros      spent     = 0;
  // Funds inside open channels where this owner is the payer.
  Micros committed = 0;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
};

enum class HoldState : int32_t {
  kActive   = 0,
  kReleased = 1,
  kRefunded = 2,
};

struct ReleaseResult {
  std::string channel_id;
  std::string task_id;
  bool        success = false;
  Micros      amount  = 0;
  Micros      paid    = 0;
  Micros      refunded = 0;
  uint64_t    sequence = 0;
  // Set when the hold had already been resolved; nothing was moved.
  bool already_released = false;
};

struct EscrowHold {
  std::string     task_id;
  Micros          amount = 0;
  HoldState       state  = HoldState::kActive;
  Micros          paid     = 0;
  Micros          refunded = 0;
  util::TimePoint locked_at{};
  util::TimePoint deadline{};
  util::TimePoint resolved_at{};

  bool Active() const {
    return state == HoldState::kActive;
  }
};

struct LedgerEntry {
  std::string                 id;
  std::string                 channel_id;
  market::v1::LedgerEntryType type = market::v1::LEDGER_ENTRY_TYPE_UNSPECIFIED;
  Micros                      amount = 0;
  std::string                 task_id;
  std::string                 reason;
  util::TimePoint             at{};
  uint64_t                    sequence = 0;

  Micros balance_after  = 0;
  Micros escrowed_after = 0;
  Micros settled_after  = 0;
};

/*
  Bilateral payment channel.

  total_deposit == current_balance + escrowed + total_settled + total_refunded
  holds the whole life of the channel; total_refunded stays 0 until close.
*/
struct Channel {
  std::string              id;
  std::string              payer_id;
  std::string              payee_id;
  std::string              auction_ref;
  market::v1::ChannelState state = market::v1::CHANNEL_STATE_OPENING;

  Micros total_deposit   = 0;
  Micros current_balance = 0;
  Micros escrowed        = 0;
  Micros total_settled   = 0;
  Micros total_refunded  = 0;

  uint64_t sequence = 0;
  bool     frozen   = false;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  std::map<std::string, EscrowHold> holds;
  std::vector<LedgerEntry>          entries;

  size_t ActiveHolds() const {
    size_t n = 0;
    for (const auto& [_, hold] : holds) {
      if (hold.Active()) ++n;
    }
    return n;
  }
};

struct LedgerStats {
  uint64_t accounts             = 0;
  uint64_t channels_opened      = 0;
  uint64_t channels_closed      = 0;
  Micros   escrow_locked        = 0;
  Micros   escrow_released      = 0;
  Micros   escrow_refunded      = 0;
  uint64_t invariant_violations = 0;
  uint64_t frozen_channels      = 0;
};

} // namespace market::ledger
