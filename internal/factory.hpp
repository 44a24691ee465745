#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/auction/auction_coordinator.hpp"
#include "internal/core/marketplace_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/discovery/health_monitor.hpp"
#include "internal/ledger/escrow_ledger.hpp"
#include "internal/settlement/escrow_reaper.hpp"

namespace market::factory {

/*
  Application

  Owns every long-lived component of the process. Background workers
  (health probes, auction sweep, escrow reaper) run between
  StartBackground() and StopBackground().
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<discovery::CapabilityIndex>    index;
  std::shared_ptr<discovery::HealthMonitor>      health;
  std::shared_ptr<auction::AuctionCoordinator>   auctions;
  std::shared_ptr<ledger::EscrowLedger>          ledger;
  std::shared_ptr<settlement::EscrowReaper>      reaper;
  std::shared_ptr<core::MarketplaceOrchestrator> orchestrator;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  bool health_enabled = false;

  void StartBackground();
  void StopBackground();
};

/*
  Build

  Composition root: the only place that knows concrete backend and
  collaborator types.
*/
Application Build(const market::runtime::config::RuntimeConfig& config);

} // namespace market::factory
