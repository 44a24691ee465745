#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace market::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  TX(t).accounts_[r.id] = r;
  return Result::Ok();
}

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto it = tx.accounts_.find(id); it != tx.accounts_.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.accounts.find(id);
  if (it == committed_.accounts.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AccountRecord> MemoryRepository::ListAccounts(Transaction& t) {
  auto&                                       tx = TX(t);
  std::map<std::string, model::AccountRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.accounts;
  }
  for (const auto& [id, record] : tx.accounts_) {
    merged[id] = record;
  }

  std::vector<model::AccountRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result MemoryRepository::UpsertChannel(Transaction& t, const model::ChannelRecord& r) {
  TX(t).channels_[r.id] = r;
  return Result::Ok();
}

std::optional<model::ChannelRecord> MemoryRepository::GetChannel(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto it = tx.channels_.find(id); it != tx.channels_.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.channels.find(id);
  if (it == committed_.channels.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ChannelRecord> MemoryRepository::ListChannels(Transaction& t) {
  auto&                                       tx = TX(t);
  std::map<std::string, model::ChannelRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.channels;
  }
  for (const auto& [id, record] : tx.channels_) {
    merged[id] = record;
  }

  std::vector<model::ChannelRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

Result MemoryRepository::AppendChannelEntry(Transaction& t, const model::ChannelEntryRecord& r) {
  auto& tx = TX(t);

  auto same_key = [&r](const model::ChannelEntryRecord& e) { return e.channel_id == r.channel_id && e.sequence == r.sequence; };
  if (std::any_of(tx.entries_.begin(), tx.entries_.end(), same_key)) {
    return Result::Err(ErrorCode::AlreadyExists, "channel entry sequence already used");
  }
  {
    std::scoped_lock lock(mutex_);
    auto             it = committed_.entries.find(r.channel_id);
    if (it != committed_.entries.end() && std::any_of(it->second.begin(), it->second.end(), same_key)) {
      return Result::Err(ErrorCode::AlreadyExists, "channel entry sequence already used");
    }
  }

  tx.entries_.push_back(r);
  return Result::Ok();
}

std::vector<model::ChannelEntryRecord> MemoryRepository::ListChannelEntries(Transaction& t, const std::string& channel_id) {
  auto&                                  tx = TX(t);
  std::vector<model::ChannelEntryRecord> out;
  {
    std::scoped_lock lock(mutex_);
    if (auto it = committed_.entries.find(channel_id); it != committed_.entries.end()) {
      out = it->second;
    }
  }
  for (const auto& entry : tx.entries_) {
    if (entry.channel_id == channel_id) out.push_back(entry);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return out;
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAuction(Transaction& t, const model::AuctionRecord& r) {
  TX(t).auctions_[r.id] = r;
  return Result::Ok();
}

std::optional<model::AuctionRecord> MemoryRepository::GetAuction(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto it = tx.auctions_.find(id); it != tx.auctions_.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.auctions.find(id);
  if (it == committed_.auctions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AuctionRecord> MemoryRepository::ListAuctions(Transaction& t) {
  auto&                                       tx = TX(t);
  std::map<std::string, model::AuctionRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.auctions;
  }
  for (const auto& [id, record] : tx.auctions_) {
    merged[id] = record;
  }

  std::vector<model::AuctionRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

} // namespace market::db::memory
