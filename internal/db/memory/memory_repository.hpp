#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace market::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                               UpsertAccount(Transaction&, const model::AccountRecord&) override;
  std::optional<model::AccountRecord>  GetAccount(Transaction&, const std::string&) override;
  std::vector<model::AccountRecord>    ListAccounts(Transaction&) override;

  Result                                 UpsertChannel(Transaction&, const model::ChannelRecord&) override;
  std::optional<model::ChannelRecord>    GetChannel(Transaction&, const std::string&) override;
  std::vector<model::ChannelRecord>      ListChannels(Transaction&) override;
  Result                                 AppendChannelEntry(Transaction&, const model::ChannelEntryRecord&) override;
  std::vector<model::ChannelEntryRecord> ListChannelEntries(Transaction&, const std::string& channel_id) override;

  Result                              UpsertAuction(Transaction&, const model::AuctionRecord&) override;
  std::optional<model::AuctionRecord> GetAuction(Transaction&, const std::string&) override;
  std::vector<model::AuctionRecord>   ListAuctions(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::AccountRecord> accounts;
    std::map<std::string, model::ChannelRecord> channels;
    std::map<std::string, model::AuctionRecord> auctions;

    std::unordered_map<std::string, std::vector<model::ChannelEntryRecord>> entries;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace market::db::memory
