#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace market::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                              UpsertAccount(Transaction&, const model::AccountRecord&) override;
  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string&) override;
  std::vector<model::AccountRecord>   ListAccounts(Transaction&) override;

  Result                                 UpsertChannel(Transaction&, const model::ChannelRecord&) override;
  std::optional<model::ChannelRecord>    GetChannel(Transaction&, const std::string&) override;
  std::vector<model::ChannelRecord>      ListChannels(Transaction&) override;
  Result                                 AppendChannelEntry(Transaction&, const model::ChannelEntryRecord&) override;
  std::vector<model::ChannelEntryRecord> ListChannelEntries(Transaction&, const std::string& channel_id) override;

  Result                              UpsertAuction(Transaction&, const model::AuctionRecord&) override;
  std::optional<model::AuctionRecord> GetAuction(Transaction&, const std::string&) override;
  std::vector<model::AuctionRecord>   ListAuctions(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace market::db::sqlite
