#include "pg_repository.hpp"

namespace market::db::postgres {

namespace {

model::AccountRecord ReadAccount(const pqxx::row& row) {
  model::AccountRecord r;
  r.id               = row[0].c_str();
  r.balance_micros   = row[1].as<int64_t>();
  r.deposited_micros = row[2].as<int64_t>();
  r.withdrawn_micros = row[3].as<int64_t>();
  r.earned_micros    = row[4].as<int64_t>();
  r.committed_micros = row[5].as<int64_t>();
  r.spent_micros     = row[6].as<int64_t>();
  r.created_at_ms    = row[7].as<uint64_t>();
  r.updated_at_ms    = row[8].as<uint64_t>();
  return r;
}

constexpr const char* kChannelSelect =
    "SELECT id,payer_id,payee_id,auction_id,state,deposit_micros,balance_micros,escrowed_micros,released_micros,total_refunded_micros,frozen,sequence,"
    "created_at_ms,updated_at_ms FROM channels";

model::ChannelRecord ReadChannel(const pqxx::row& row) {
  model::ChannelRecord r;
  r.id                    = row[0].c_str();
  r.payer_id              = row[1].c_str();
  r.payee_id              = row[2].c_str();
  r.auction_id            = row[3].is_null() ? "" : row[3].c_str();
  r.state                 = row[4].as<int32_t>();
  r.deposit_micros        = row[5].as<int64_t>();
  r.balance_micros        = row[6].as<int64_t>();
  r.escrowed_micros       = row[7].as<int64_t>();
  r.released_micros       = row[8].as<int64_t>();
  r.total_refunded_micros = row[9].as<int64_t>();
  r.frozen                = row[10].as<bool>();
  r.sequence              = row[11].as<uint64_t>();
  r.created_at_ms         = row[12].as<uint64_t>();
  r.updated_at_ms         = row[13].as<uint64_t>();
  return r;
}

void LoadHolds(pqxx::work& work, model::ChannelRecord& r) {
  auto res = work.exec_params(
      "SELECT task_id,amount_micros,state,payee_micros,refunded_micros,locked_at_ms,deadline_ms,resolved_at_ms FROM channel_holds "
      "WHERE channel_id=$1 ORDER BY locked_at_ms ASC, task_id ASC;",
      r.id);
  r.holds.reserve(res.size());
  for (const auto& row : res) {
    model::HoldRecord h;
    h.task_id         = row[0].c_str();
    h.amount_micros   = row[1].as<int64_t>();
    h.state           = row[2].as<int32_t>();
    h.payee_micros    = row[3].as<int64_t>();
    h.refunded_micros = row[4].as<int64_t>();
    h.locked_at_ms    = row[5].as<uint64_t>();
    h.deadline_ms     = row[6].as<uint64_t>();
    h.resolved_at_ms  = row[7].as<uint64_t>();
    r.holds.push_back(std::move(h));
  }
}

constexpr const char* kAuctionSelect =
    "SELECT id,task_id,requester_id,kind,status,reserve_price,max_price,final_price,winning_bid_id,created_at_ms,expires_at_ms FROM auctions";

model::AuctionRecord ReadAuction(const pqxx::row& row) {
  model::AuctionRecord r;
  r.id             = row[0].c_str();
  r.task_id        = row[1].c_str();
  r.requester_id   = row[2].is_null() ? "" : row[2].c_str();
  r.kind           = row[3].as<int32_t>();
  r.status         = row[4].as<int32_t>();
  r.reserve_price  = row[5].as<double>();
  r.max_price      = row[6].as<double>();
  r.final_price    = row[7].as<double>();
  r.winning_bid_id = row[8].is_null() ? "" : row[8].c_str();
  r.created_at_ms  = row[9].as<uint64_t>();
  r.expires_at_ms  = row[10].as<uint64_t>();
  return r;
}

void LoadBids(pqxx::work& work, model::AuctionRecord& r) {
  auto res = work.exec_params(
      "SELECT bid_id,worker_id,price,estimated_completion_ms,reputation,quality,sequence,submitted_at_ms,score FROM auction_bids "
      "WHERE auction_id=$1 ORDER BY sequence ASC;",
      r.id);
  r.bids.reserve(res.size());
  for (const auto& row : res) {
    model::BidRecord b;
    b.bid_id                  = row[0].c_str();
    b.worker_id               = row[1].c_str();
    b.price                   = row[2].as<double>();
    b.estimated_completion_ms = row[3].as<uint64_t>();
    b.reputation              = row[4].as<double>();
    b.quality                 = row[5].as<double>();
    b.sequence                = row[6].as<uint64_t>();
    b.submitted_at_ms         = row[7].as<uint64_t>();
    b.score                   = row[8].as<double>();
    r.bids.push_back(std::move(b));
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result PgRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_account", r.id, r.balance_micros, r.deposited_micros, r.withdrawn_micros, r.earned_micros,
                               r.committed_micros, r.spent_micros, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AccountRecord> PgRepository::GetAccount(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_account", id);
  if (res.empty()) return std::nullopt;
  return ReadAccount(res[0]);
}

std::vector<model::AccountRecord> PgRepository::ListAccounts(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,balance_micros,deposited_micros,withdrawn_micros,earned_micros,committed_micros,spent_micros,created_at_ms,updated_at_ms "
      "FROM accounts ORDER BY id ASC;");

  std::vector<model::AccountRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadAccount(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result PgRepository::UpsertChannel(Transaction& t, const model::ChannelRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("upsert_channel", r.id, r.payer_id, r.payee_id, r.auction_id, r.state, r.deposit_micros, r.balance_micros, r.escrowed_micros,
                       r.released_micros, r.total_refunded_micros, r.frozen, r.sequence, r.created_at_ms, r.updated_at_ms);
    work.exec_params("DELETE FROM channel_holds WHERE channel_id=$1;", r.id);
    for (const auto& h : r.holds) {
      work.exec_prepared("insert_hold", r.id, h.task_id, h.amount_micros, h.state, h.payee_micros, h.refunded_micros, h.locked_at_ms,
                         h.deadline_ms, h.resolved_at_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ChannelRecord> PgRepository::GetChannel(Transaction& t, const std::string& id) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_params(std::string(kChannelSelect) + " WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  auto record = ReadChannel(res[0]);
  LoadHolds(work, record);
  return record;
}

std::vector<model::ChannelRecord> PgRepository::ListChannels(Transaction& t) {
  auto& work = TX(t).Work();
  auto  res  = work.exec(std::string(kChannelSelect) + " ORDER BY id ASC;");

  std::vector<model::ChannelRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadChannel(row));
  }
  for (auto& record : out) {
    LoadHolds(work, record);
  }
  return out;
}

Result PgRepository::AppendChannelEntry(Transaction& t, const model::ChannelEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("append_entry", r.channel_id, r.sequence, r.tx_id, r.type, r.task_id, r.amount_micros, r.reason, r.at_ms,
                               r.balance_after_micros, r.escrowed_after_micros, r.settled_after_micros);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ChannelEntryRecord> PgRepository::ListChannelEntries(Transaction& t, const std::string& channel_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT channel_id,sequence,tx_id,type,task_id,amount_micros,reason,at_ms,balance_after_micros,escrowed_after_micros,settled_after_micros "
      "FROM channel_entries WHERE channel_id=$1 ORDER BY sequence ASC;",
      channel_id);

  std::vector<model::ChannelEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ChannelEntryRecord r;
    r.channel_id    = row[0].c_str();
    r.sequence      = row[1].as<uint64_t>();
    r.tx_id         = row[2].c_str();
    r.type          = row[3].as<int32_t>();
    r.task_id       = row[4].is_null() ? "" : row[4].c_str();
    r.amount_micros         = row[5].as<int64_t>();
    r.reason                = row[6].is_null() ? "" : row[6].c_str();
    r.at_ms                 = row[7].as<uint64_t>();
    r.balance_after_micros  = row[8].as<int64_t>();
    r.escrowed_after_micros = row[9].as<int64_t>();
    r.settled_after_micros  = row[10].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result PgRepository::UpsertAuction(Transaction& t, const model::AuctionRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("upsert_auction", r.id, r.task_id, r.requester_id, r.kind, r.status, r.reserve_price, r.max_price, r.final_price,
                       r.winning_bid_id, r.created_at_ms, r.expires_at_ms);
    work.exec_params("DELETE FROM auction_bids WHERE auction_id=$1;", r.id);
    for (const auto& b : r.bids) {
      work.exec_prepared("insert_bid", r.id, b.bid_id, b.worker_id, b.price, b.estimated_completion_ms, b.reputation, b.quality, b.sequence,
                         b.submitted_at_ms, b.score);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AuctionRecord> PgRepository::GetAuction(Transaction& t, const std::string& id) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_params(std::string(kAuctionSelect) + " WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  auto record = ReadAuction(res[0]);
  LoadBids(work, record);
  return record;
}

std::vector<model::AuctionRecord> PgRepository::ListAuctions(Transaction& t) {
  auto& work = TX(t).Work();
  auto  res  = work.exec(std::string(kAuctionSelect) + " ORDER BY id ASC;");

  std::vector<model::AuctionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadAuction(row));
  }
  for (auto& record : out) {
    LoadBids(work, record);
  }
  return out;
}

} // namespace market::db::postgres
