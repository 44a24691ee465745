#pragma once

#include <memory>

namespace market::discovery {
class CapabilityIndex;
}
namespace market::auction {
class AuctionCoordinator;
}
namespace market::ledger {
class EscrowLedger;
}
namespace market::core {
class MarketplaceOrchestrator;
}
namespace market::db {
class Repository;
}
namespace market::clients {
class ReputationClient;
}

namespace market::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<market::discovery::CapabilityIndex>      index;
  std::shared_ptr<market::auction::AuctionCoordinator>     auctions;
  std::shared_ptr<market::ledger::EscrowLedger>            ledger;
  std::shared_ptr<market::core::MarketplaceOrchestrator>   orchestrator;
  std::shared_ptr<market::db::Repository>                  repository;
  std::shared_ptr<market::clients::ReputationClient>       reputation;
};

} // namespace market::service
