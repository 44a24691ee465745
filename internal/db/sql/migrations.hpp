#pragma once

#include <string>
#include <vector>

namespace market::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL(). Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so the bootstrap runs on every start.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

inline void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS accounts (id TEXT PRIMARY KEY, balance_micros INTEGER NOT NULL, deposited_micros INTEGER NOT NULL, "
      "withdrawn_micros INTEGER NOT NULL, earned_micros INTEGER NOT NULL, committed_micros INTEGER NOT NULL, spent_micros INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS channels (id TEXT PRIMARY KEY, payer_id TEXT NOT NULL, payee_id TEXT NOT NULL, auction_id TEXT, state INTEGER NOT NULL, "
      "deposit_micros INTEGER NOT NULL, balance_micros INTEGER NOT NULL, escrowed_micros INTEGER NOT NULL, released_micros INTEGER NOT NULL, "
      "total_refunded_micros INTEGER NOT NULL, frozen INTEGER NOT NULL, sequence INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS channel_holds (channel_id TEXT NOT NULL REFERENCES channels(id) ON DELETE CASCADE, task_id TEXT NOT NULL, "
      "amount_micros INTEGER NOT NULL, state INTEGER NOT NULL, payee_micros INTEGER NOT NULL, refunded_micros INTEGER NOT NULL, "
      "locked_at_ms INTEGER NOT NULL, deadline_ms INTEGER NOT NULL, resolved_at_ms INTEGER NOT NULL, PRIMARY KEY (channel_id, task_id));",
      "CREATE TABLE IF NOT EXISTS channel_entries (channel_id TEXT NOT NULL, sequence INTEGER NOT NULL, tx_id TEXT NOT NULL, type INTEGER NOT NULL, "
      "task_id TEXT, amount_micros INTEGER NOT NULL, reason TEXT, at_ms INTEGER NOT NULL, balance_after_micros INTEGER NOT NULL, "
      "escrowed_after_micros INTEGER NOT NULL, settled_after_micros INTEGER NOT NULL, PRIMARY KEY (channel_id, sequence));",
      "CREATE TABLE IF NOT EXISTS auctions (id TEXT PRIMARY KEY, task_id TEXT NOT NULL, requester_id TEXT, kind INTEGER NOT NULL, status INTEGER NOT NULL, "
      "reserve_price REAL NOT NULL, max_price REAL NOT NULL, final_price REAL NOT NULL, winning_bid_id TEXT, created_at_ms INTEGER NOT NULL, "
      "expires_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS auction_bids (auction_id TEXT NOT NULL REFERENCES auctions(id) ON DELETE CASCADE, bid_id TEXT NOT NULL, "
      "worker_id TEXT NOT NULL, price REAL NOT NULL, estimated_completion_ms INTEGER NOT NULL, reputation REAL NOT NULL, quality REAL NOT NULL, "
      "sequence INTEGER NOT NULL, submitted_at_ms INTEGER NOT NULL, score REAL NOT NULL, PRIMARY KEY (auction_id, bid_id));",
      "CREATE TABLE IF NOT EXISTS market_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS accounts (id TEXT PRIMARY KEY, balance_micros BIGINT NOT NULL, deposited_micros BIGINT NOT NULL, "
      "withdrawn_micros BIGINT NOT NULL, earned_micros BIGINT NOT NULL, committed_micros BIGINT NOT NULL, spent_micros BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS channels (id TEXT PRIMARY KEY, payer_id TEXT NOT NULL, payee_id TEXT NOT NULL, auction_id TEXT, state SMALLINT NOT NULL, "
      "deposit_micros BIGINT NOT NULL, balance_micros BIGINT NOT NULL, escrowed_micros BIGINT NOT NULL, released_micros BIGINT NOT NULL, "
      "total_refunded_micros BIGINT NOT NULL, frozen BOOLEAN NOT NULL, sequence BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS channel_holds (channel_id TEXT NOT NULL REFERENCES channels(id) ON DELETE CASCADE, task_id TEXT NOT NULL, "
      "amount_micros BIGINT NOT NULL, state SMALLINT NOT NULL, payee_micros BIGINT NOT NULL, refunded_micros BIGINT NOT NULL, "
      "locked_at_ms BIGINT NOT NULL, deadline_ms BIGINT NOT NULL, resolved_at_ms BIGINT NOT NULL, PRIMARY KEY (channel_id, task_id));",
      "CREATE TABLE IF NOT EXISTS channel_entries (channel_id TEXT NOT NULL, sequence BIGINT NOT NULL, tx_id TEXT NOT NULL, type SMALLINT NOT NULL, "
      "task_id TEXT, amount_micros BIGINT NOT NULL, reason TEXT, at_ms BIGINT NOT NULL, balance_after_micros BIGINT NOT NULL, "
      "escrowed_after_micros BIGINT NOT NULL, settled_after_micros BIGINT NOT NULL, PRIMARY KEY (channel_id, sequence));",
      "CREATE TABLE IF NOT EXISTS auctions (id TEXT PRIMARY KEY, task_id TEXT NOT NULL, requester_id TEXT, kind SMALLINT NOT NULL, status SMALLINT NOT NULL, "
      "reserve_price DOUBLE PRECISION NOT NULL, max_price DOUBLE PRECISION NOT NULL, final_price DOUBLE PRECISION NOT NULL, winning_bid_id TEXT, "
      "created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS auction_bids (auction_id TEXT NOT NULL REFERENCES auctions(id) ON DELETE CASCADE, bid_id TEXT NOT NULL, "
      "worker_id TEXT NOT NULL, price DOUBLE PRECISION NOT NULL, estimated_completion_ms BIGINT NOT NULL, reputation DOUBLE PRECISION NOT NULL, "
      "quality DOUBLE PRECISION NOT NULL, sequence BIGINT NOT NULL, submitted_at_ms BIGINT NOT NULL, score DOUBLE PRECISION NOT NULL, "
      "PRIMARY KEY (auction_id, bid_id));",
      "CREATE TABLE IF NOT EXISTS market_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());"};
  return kSchema;
}

} // namespace market::db::sql
