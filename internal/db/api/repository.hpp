#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/auction_record.hpp"
#include "internal/db/model/channel_record.hpp"

namespace market::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Upserts replace the whole record (a channel's holds included)
  - Channel entries are append-only; (channel_id, sequence) is unique

  The in-process ledger and auction tables are authoritative while the
  process runs; the repository is the durable copy they hydrate from.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Accounts
  // ---------------------------------------------------------------------

  virtual Result UpsertAccount(Transaction&, const model::AccountRecord&) = 0;

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::AccountRecord> ListAccounts(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Payment channels
  // ---------------------------------------------------------------------

  virtual Result UpsertChannel(Transaction&, const model::ChannelRecord&) = 0;

  virtual std::optional<model::ChannelRecord> GetChannel(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ChannelRecord> ListChannels(Transaction&) = 0;

  virtual Result AppendChannelEntry(Transaction&, const model::ChannelEntryRecord&) = 0;

  // Ordered by sequence.
  virtual std::vector<model::ChannelEntryRecord> ListChannelEntries(Transaction&, const std::string& channel_id) = 0;

  // ---------------------------------------------------------------------
  // Auctions
  // ---------------------------------------------------------------------

  virtual Result UpsertAuction(Transaction&, const model::AuctionRecord&) = 0;

  virtual std::optional<model::AuctionRecord> GetAuction(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::AuctionRecord> ListAuctions(Transaction&) = 0;

};

} // namespace market::db
