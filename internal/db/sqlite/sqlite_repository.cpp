#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace market::db::sqlite {

using market::db::ErrorCode;
using market::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int32_t ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

constexpr const char* kAccountColumns =
    "SELECT id,balance_micros,deposited_micros,withdrawn_micros,earned_micros,committed_micros,spent_micros,created_at_ms,updated_at_ms FROM accounts";

model::AccountRecord ReadAccount(sqlite3_stmt* st) {
  model::AccountRecord r;
  r.id               = ColText(st, 0);
  r.balance_micros   = ColI64(st, 1);
  r.deposited_micros = ColI64(st, 2);
  r.withdrawn_micros = ColI64(st, 3);
  r.earned_micros    = ColI64(st, 4);
  r.committed_micros = ColI64(st, 5);
  r.spent_micros     = ColI64(st, 6);
  r.created_at_ms    = ColU64(st, 7);
  r.updated_at_ms    = ColU64(st, 8);
  return r;
}

constexpr const char* kChannelColumns =
    "SELECT id,payer_id,payee_id,auction_id,state,deposit_micros,balance_micros,escrowed_micros,released_micros,total_refunded_micros,frozen,sequence,"
    "created_at_ms,updated_at_ms FROM channels";

model::ChannelRecord ReadChannel(sqlite3_stmt* st) {
  model::ChannelRecord r;
  r.id                    = ColText(st, 0);
  r.payer_id              = ColText(st, 1);
  r.payee_id              = ColText(st, 2);
  r.auction_id            = ColText(st, 3);
  r.state                 = ColI32(st, 4);
  r.deposit_micros        = ColI64(st, 5);
  r.balance_micros        = ColI64(st, 6);
  r.escrowed_micros       = ColI64(st, 7);
  r.released_micros       = ColI64(st, 8);
  r.total_refunded_micros = ColI64(st, 9);
  r.frozen                = ColI32(st, 10) != 0;
  r.sequence              = ColU64(st, 11);
  r.created_at_ms         = ColU64(st, 12);
  r.updated_at_ms         = ColU64(st, 13);
  return r;
}

void LoadHolds(sqlite3* db, model::ChannelRecord& r) {
  Statement st(db,
               "SELECT task_id,amount_micros,state,payee_micros,refunded_micros,locked_at_ms,deadline_ms,resolved_at_ms FROM channel_holds "
               "WHERE channel_id=? ORDER BY locked_at_ms ASC, task_id ASC;");
  if (!st) return;

  BindText(st.get(), 1, r.id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::HoldRecord h;
    h.task_id         = ColText(st.get(), 0);
    h.amount_micros   = ColI64(st.get(), 1);
    h.state           = ColI32(st.get(), 2);
    h.payee_micros    = ColI64(st.get(), 3);
    h.refunded_micros = ColI64(st.get(), 4);
    h.locked_at_ms    = ColU64(st.get(), 5);
    h.deadline_ms     = ColU64(st.get(), 6);
    h.resolved_at_ms  = ColU64(st.get(), 7);
    r.holds.push_back(std::move(h));
  }
}

constexpr const char* kAuctionColumns =
    "SELECT id,task_id,requester_id,kind,status,reserve_price,max_price,final_price,winning_bid_id,created_at_ms,expires_at_ms FROM auctions";

model::AuctionRecord ReadAuction(sqlite3_stmt* st) {
  model::AuctionRecord r;
  r.id             = ColText(st, 0);
  r.task_id        = ColText(st, 1);
  r.requester_id   = ColText(st, 2);
  r.kind           = ColI32(st, 3);
  r.status         = ColI32(st, 4);
  r.reserve_price  = ColDouble(st, 5);
  r.max_price      = ColDouble(st, 6);
  r.final_price    = ColDouble(st, 7);
  r.winning_bid_id = ColText(st, 8);
  r.created_at_ms  = ColU64(st, 9);
  r.expires_at_ms  = ColU64(st, 10);
  return r;
}

void LoadBids(sqlite3* db, model::AuctionRecord& r) {
  Statement st(db,
               "SELECT bid_id,worker_id,price,estimated_completion_ms,reputation,quality,sequence,submitted_at_ms,score FROM auction_bids "
               "WHERE auction_id=? ORDER BY sequence ASC;");
  if (!st) return;

  BindText(st.get(), 1, r.id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::BidRecord b;
    b.bid_id                  = ColText(st.get(), 0);
    b.worker_id               = ColText(st.get(), 1);
    b.price                   = ColDouble(st.get(), 2);
    b.estimated_completion_ms = ColU64(st.get(), 3);
    b.reputation              = ColDouble(st.get(), 4);
    b.quality                 = ColDouble(st.get(), 5);
    b.sequence                = ColU64(st.get(), 6);
    b.submitted_at_ms         = ColU64(st.get(), 7);
    b.score                   = ColDouble(st.get(), 8);
    r.bids.push_back(std::move(b));
  }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO accounts(id,balance_micros,deposited_micros,withdrawn_micros,earned_micros,committed_micros,spent_micros,created_at_ms,updated_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?,?) ON CONFLICT(id) DO UPDATE SET balance_micros=excluded.balance_micros,"
               "deposited_micros=excluded.deposited_micros,withdrawn_micros=excluded.withdrawn_micros,earned_micros=excluded.earned_micros,"
               "committed_micros=excluded.committed_micros,spent_micros=excluded.spent_micros,updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindI64(st.get(), 2, r.balance_micros);
  BindI64(st.get(), 3, r.deposited_micros);
  BindI64(st.get(), 4, r.withdrawn_micros);
  BindI64(st.get(), 5, r.earned_micros);
  BindI64(st.get(), 6, r.committed_micros);
  BindI64(st.get(), 7, r.spent_micros);
  BindU64(st.get(), 8, r.created_at_ms);
  BindU64(st.get(), 9, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AccountRecord> SqliteRepository::GetAccount(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kAccountColumns) + " WHERE id=?;").c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadAccount(st.get());
}

std::vector<model::AccountRecord> SqliteRepository::ListAccounts(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kAccountColumns) + " ORDER BY id ASC;").c_str());
  if (!st) return {};

  std::vector<model::AccountRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadAccount(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result SqliteRepository::UpsertChannel(Transaction& t, const model::ChannelRecord& r) {
  auto* db = TX(t).Handle();

  {
    Statement st(db,
                 "INSERT INTO channels(id,payer_id,payee_id,auction_id,state,deposit_micros,balance_micros,escrowed_micros,released_micros,"
                 "total_refunded_micros,frozen,sequence,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                 "ON CONFLICT(id) DO UPDATE SET state=excluded.state,deposit_micros=excluded.deposit_micros,balance_micros=excluded.balance_micros,"
                 "escrowed_micros=excluded.escrowed_micros,released_micros=excluded.released_micros,"
                 "total_refunded_micros=excluded.total_refunded_micros,frozen=excluded.frozen,sequence=excluded.sequence,"
                 "updated_at_ms=excluded.updated_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.payer_id);
    BindText(st.get(), 3, r.payee_id);
    BindText(st.get(), 4, r.auction_id);
    BindI64(st.get(), 5, r.state);
    BindI64(st.get(), 6, r.deposit_micros);
    BindI64(st.get(), 7, r.balance_micros);
    BindI64(st.get(), 8, r.escrowed_micros);
    BindI64(st.get(), 9, r.released_micros);
    BindI64(st.get(), 10, r.total_refunded_micros);
    BindI64(st.get(), 11, r.frozen ? 1 : 0);
    BindU64(st.get(), 12, r.sequence);
    BindU64(st.get(), 13, r.created_at_ms);
    BindU64(st.get(), 14, r.updated_at_ms);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }

  {
    Statement del(db, "DELETE FROM channel_holds WHERE channel_id=?;");
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(del.get(), 1, r.id);
    auto res = Translate(db, sqlite3_step(del.get()));
    if (!res) return res;
  }

  for (const auto& h : r.holds) {
    Statement st(db,
                 "INSERT INTO channel_holds(channel_id,task_id,amount_micros,state,payee_micros,refunded_micros,locked_at_ms,deadline_ms,"
                 "resolved_at_ms) VALUES(?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, h.task_id);
    BindI64(st.get(), 3, h.amount_micros);
    BindI64(st.get(), 4, h.state);
    BindI64(st.get(), 5, h.payee_micros);
    BindI64(st.get(), 6, h.refunded_micros);
    BindU64(st.get(), 7, h.locked_at_ms);
    BindU64(st.get(), 8, h.deadline_ms);
    BindU64(st.get(), 9, h.resolved_at_ms);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  return Result::Ok();
}

std::optional<model::ChannelRecord> SqliteRepository::GetChannel(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  std::optional<model::ChannelRecord> out;
  {
    Statement st(db, (std::string(kChannelColumns) + " WHERE id=?;").c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    out = ReadChannel(st.get());
  }
  LoadHolds(db, *out);
  return out;
}

std::vector<model::ChannelRecord> SqliteRepository::ListChannels(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::ChannelRecord> out;
  {
    Statement st(db, (std::string(kChannelColumns) + " ORDER BY id ASC;").c_str());
    if (!st) return {};
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      out.push_back(ReadChannel(st.get()));
    }
  }
  for (auto& r : out) {
    LoadHolds(db, r);
  }
  return out;
}

Result SqliteRepository::AppendChannelEntry(Transaction& t, const model::ChannelEntryRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO channel_entries(channel_id,sequence,tx_id,type,task_id,amount_micros,reason,at_ms,balance_after_micros,"
               "escrowed_after_micros,settled_after_micros) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.channel_id);
  BindU64(st.get(), 2, r.sequence);
  BindText(st.get(), 3, r.tx_id);
  BindI64(st.get(), 4, r.type);
  BindText(st.get(), 5, r.task_id);
  BindI64(st.get(), 6, r.amount_micros);
  BindText(st.get(), 7, r.reason);
  BindU64(st.get(), 8, r.at_ms);
  BindI64(st.get(), 9, r.balance_after_micros);
  BindI64(st.get(), 10, r.escrowed_after_micros);
  BindI64(st.get(), 11, r.settled_after_micros);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ChannelEntryRecord> SqliteRepository::ListChannelEntries(Transaction& t, const std::string& channel_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT channel_id,sequence,tx_id,type,task_id,amount_micros,reason,at_ms,balance_after_micros,escrowed_after_micros,"
               "settled_after_micros FROM channel_entries WHERE channel_id=? ORDER BY sequence ASC;");
  if (!st) return {};

  BindText(st.get(), 1, channel_id);

  std::vector<model::ChannelEntryRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::ChannelEntryRecord r;
    r.channel_id    = ColText(st.get(), 0);
    r.sequence      = ColU64(st.get(), 1);
    r.tx_id         = ColText(st.get(), 2);
    r.type          = ColI32(st.get(), 3);
    r.task_id       = ColText(st.get(), 4);
    r.amount_micros         = ColI64(st.get(), 5);
    r.reason                = ColText(st.get(), 6);
    r.at_ms                 = ColU64(st.get(), 7);
    r.balance_after_micros  = ColI64(st.get(), 8);
    r.escrowed_after_micros = ColI64(st.get(), 9);
    r.settled_after_micros  = ColI64(st.get(), 10);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAuction(Transaction& t, const model::AuctionRecord& r) {
  auto* db = TX(t).Handle();

  {
    Statement st(db,
                 "INSERT INTO auctions(id,task_id,requester_id,kind,status,reserve_price,max_price,final_price,winning_bid_id,created_at_ms,"
                 "expires_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(id) DO UPDATE SET status=excluded.status,"
                 "final_price=excluded.final_price,winning_bid_id=excluded.winning_bid_id,expires_at_ms=excluded.expires_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.task_id);
    BindText(st.get(), 3, r.requester_id);
    BindI64(st.get(), 4, r.kind);
    BindI64(st.get(), 5, r.status);
    BindDouble(st.get(), 6, r.reserve_price);
    BindDouble(st.get(), 7, r.max_price);
    BindDouble(st.get(), 8, r.final_price);
    BindText(st.get(), 9, r.winning_bid_id);
    BindU64(st.get(), 10, r.created_at_ms);
    BindU64(st.get(), 11, r.expires_at_ms);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }

  {
    Statement del(db, "DELETE FROM auction_bids WHERE auction_id=?;");
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(del.get(), 1, r.id);
    auto res = Translate(db, sqlite3_step(del.get()));
    if (!res) return res;
  }

  for (const auto& b : r.bids) {
    Statement st(db,
                 "INSERT INTO auction_bids(auction_id,bid_id,worker_id,price,estimated_completion_ms,reputation,quality,sequence,submitted_at_ms,score) "
                 "VALUES(?,?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, b.bid_id);
    BindText(st.get(), 3, b.worker_id);
    BindDouble(st.get(), 4, b.price);
    BindU64(st.get(), 5, b.estimated_completion_ms);
    BindDouble(st.get(), 6, b.reputation);
    BindDouble(st.get(), 7, b.quality);
    BindU64(st.get(), 8, b.sequence);
    BindU64(st.get(), 9, b.submitted_at_ms);
    BindDouble(st.get(), 10, b.score);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  return Result::Ok();
}

std::optional<model::AuctionRecord> SqliteRepository::GetAuction(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  std::optional<model::AuctionRecord> out;
  {
    Statement st(db, (std::string(kAuctionColumns) + " WHERE id=?;").c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    out = ReadAuction(st.get());
  }
  LoadBids(db, *out);
  return out;
}

std::vector<model::AuctionRecord> SqliteRepository::ListAuctions(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::AuctionRecord> out;
  {
    Statement st(db, (std::string(kAuctionColumns) + " ORDER BY id ASC;").c_str());
    if (!st) return {};
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      out.push_back(ReadAuction(st.get()));
    }
  }
  for (auto& r : out) {
    LoadBids(db, r);
  }
  return out;
}

} // namespace market::db::sqlite
