#include "memory_tx.hpp"

#include <mutex>
#include <stdexcept>

namespace market::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  for (auto& [id, record] : accounts_) {
    state.accounts[id] = std::move(record);
  }
  for (auto& [id, record] : channels_) {
    state.channels[id] = std::move(record);
  }
  for (auto& [id, record] : auctions_) {
    state.auctions[id] = std::move(record);
  }
  for (auto& entry : entries_) {
    state.entries[entry.channel_id].push_back(std::move(entry));
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  accounts_.clear();
  channels_.clear();
  auctions_.clear();
  entries_.clear();
  rolled_back_ = true;
}

} // namespace market::db::memory
