#pragma once

#include <atomic>
#include <memory>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace market::testing {

// Forwards to another repository; channel writes fail while armed.
class FlakyRepository final : public db::Repository {
 public:
  explicit FlakyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void FailChannelWrites(bool fail) {
    fail_channel_writes_ = fail;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result UpsertAccount(db::Transaction& tx, const db::model::AccountRecord& record) override {
    return inner_->UpsertAccount(tx, record);
  }

  std::optional<db::model::AccountRecord> GetAccount(db::Transaction& tx, const std::string& id) override {
    return inner_->GetAccount(tx, id);
  }

  std::vector<db::model::AccountRecord> ListAccounts(db::Transaction& tx) override {
    return inner_->ListAccounts(tx);
  }

  db::Result UpsertChannel(db::Transaction& tx, const db::model::ChannelRecord& record) override {
    if (fail_channel_writes_) {
      return db::Result::Err(db::ErrorCode::IOError, "disk unavailable");
    }
    return inner_->UpsertChannel(tx, record);
  }

  std::optional<db::model::ChannelRecord> GetChannel(db::Transaction& tx, const std::string& id) override {
    return inner_->GetChannel(tx, id);
  }

  std::vector<db::model::ChannelRecord> ListChannels(db::Transaction& tx) override {
    return inner_->ListChannels(tx);
  }

  db::Result AppendChannelEntry(db::Transaction& tx, const db::model::ChannelEntryRecord& record) override {
    if (fail_channel_writes_) {
      return db::Result::Err(db::ErrorCode::IOError, "disk unavailable");
    }
    return inner_->AppendChannelEntry(tx, record);
  }

  std::vector<db::model::ChannelEntryRecord> ListChannelEntries(db::Transaction& tx, const std::string& channel_id) override {
    return inner_->ListChannelEntries(tx, channel_id);
  }

  db::Result UpsertAuction(db::Transaction& tx, const db::model::AuctionRecord& record) override {
    return inner_->UpsertAuction(tx, record);
  }

  std::optional<db::model::AuctionRecord> GetAuction(db::Transaction& tx, const std::string& id) override {
    return inner_->GetAuction(tx, id);
  }

  std::vector<db::model::AuctionRecord> ListAuctions(db::Transaction& tx) override {
    return inner_->ListAuctions(tx);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
  std::atomic<bool>               fail_channel_writes_{false};
};

} // namespace market::testing
