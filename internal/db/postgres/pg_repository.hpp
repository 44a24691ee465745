#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace market::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace market::db::postgres
