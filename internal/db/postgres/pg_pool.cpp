#include "pg_pool.hpp"

namespace market::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_account",
               "INSERT INTO accounts(id,balance_micros,deposited_micros,withdrawn_micros,earned_micros,committed_micros,spent_micros,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT(id) DO UPDATE SET balance_micros=EXCLUDED.balance_micros,"
               "deposited_micros=EXCLUDED.deposited_micros,withdrawn_micros=EXCLUDED.withdrawn_micros,earned_micros=EXCLUDED.earned_micros,"
               "committed_micros=EXCLUDED.committed_micros,spent_micros=EXCLUDED.spent_micros,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_account",
               "SELECT id,balance_micros,deposited_micros,withdrawn_micros,earned_micros,committed_micros,spent_micros,created_at_ms,updated_at_ms "
               "FROM accounts WHERE id=$1");

  conn.prepare("upsert_channel",
               "INSERT INTO channels(id,payer_id,payee_id,auction_id,state,deposit_micros,balance_micros,escrowed_micros,released_micros,"
               "total_refunded_micros,frozen,sequence,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14) "
               "ON CONFLICT(id) DO UPDATE SET state=EXCLUDED.state,deposit_micros=EXCLUDED.deposit_micros,balance_micros=EXCLUDED.balance_micros,"
               "escrowed_micros=EXCLUDED.escrowed_micros,released_micros=EXCLUDED.released_micros,"
               "total_refunded_micros=EXCLUDED.total_refunded_micros,frozen=EXCLUDED.frozen,sequence=EXCLUDED.sequence,"
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("insert_hold",
               "INSERT INTO channel_holds(channel_id,task_id,amount_micros,state,payee_micros,refunded_micros,locked_at_ms,deadline_ms,resolved_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("append_entry",
               "INSERT INTO channel_entries(channel_id,sequence,tx_id,type,task_id,amount_micros,reason,at_ms,balance_after_micros,"
               "escrowed_after_micros,settled_after_micros) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("upsert_auction",
               "INSERT INTO auctions(id,task_id,requester_id,kind,status,reserve_price,max_price,final_price,winning_bid_id,created_at_ms,"
               "expires_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) ON CONFLICT(id) DO UPDATE SET status=EXCLUDED.status,"
               "final_price=EXCLUDED.final_price,winning_bid_id=EXCLUDED.winning_bid_id,expires_at_ms=EXCLUDED.expires_at_ms");

  conn.prepare("insert_bid",
               "INSERT INTO auction_bids(auction_id,bid_id,worker_id,price,estimated_completion_ms,reputation,quality,sequence,submitted_at_ms,score) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace market::db::postgres
