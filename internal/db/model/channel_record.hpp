#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace market::db::model {

/*
  Escrow hold for one task inside a channel.

  state: 0 = active, 1 = released, 2 = refunded
*/
struct HoldRecord {
  std::string task_id;
  int64_t     amount_micros   = 0;
  int32_t     state           = 0;
  int64_t     payee_micros    = 0;
  int64_t     refunded_micros = 0;
  uint64_t    locked_at_ms    = 0;
  uint64_t    deadline_ms     = 0;
  uint64_t    resolved_at_ms  = 0;
};

struct ChannelRecord {
  std::string id;
  std::string payer_id;
  std::string payee_id;
  std::string auction_id;
  int32_t     state = 0; // market::v1::ChannelState

  int64_t deposit_micros        = 0;
  int64_t balance_micros        = 0;
  int64_t escrowed_micros       = 0;
  int64_t released_micros       = 0;
  int64_t total_refunded_micros = 0;

  bool     frozen        = false;
  uint64_t sequence      = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  std::vector<HoldRecord> holds;
};

// Append-only transaction log entry, ordered by (channel_id, sequence).
struct ChannelEntryRecord {
  std::string channel_id;
  uint64_t    sequence = 0;
  std::string tx_id;
  int32_t     type = 0; // market::v1::LedgerEntryType
  std::string task_id;
  int64_t     amount_micros = 0;
  std::string reason;
  uint64_t    at_ms = 0;

  // Channel totals after the entry was applied.
  int64_t balance_after_micros  = 0;
  int64_t escrowed_after_micros = 0;
  int64_t settled_after_micros  = 0;
};

} // namespace market::db::model
