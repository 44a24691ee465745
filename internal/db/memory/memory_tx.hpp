#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace market::db::memory {

/*
  Transaction = per-key write set over the committed state.

  Writes are buffered and applied under the repository mutex at Commit(),
  so concurrent transactions touching different keys never conflict.
  Last commit wins per key.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  friend class MemoryRepository;

  MemoryRepository& repo_;

  std::map<std::string, model::AccountRecord> accounts_;
  std::map<std::string, model::ChannelRecord> channels_;
  std::map<std::string, model::AuctionRecord> auctions_;
  std::vector<model::ChannelEntryRecord>      entries_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace market::db::memory
