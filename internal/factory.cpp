#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <stdexcept>
#include <string>

#include "internal/clients/grpc_execution_client.hpp"
#include "internal/clients/grpc_reputation_client.hpp"
#include "internal/clients/grpc_worker_transport.hpp"
#include "internal/clients/in_memory_reputation_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/allocation_server.hpp"
#include "internal/grpc/auction_server.hpp"
#include "internal/grpc/discovery_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/allocation_service.hpp"
#include "internal/service/auction_service.hpp"
#include "internal/service/discovery_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/settlement/settlement_coordinator.hpp"
#include "internal/util/time.hpp"
#if MARKET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MARKET_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace market::factory {

using namespace std::chrono_literals;
using market::runtime::config::RuntimeConfig;

namespace {

#if MARKET_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if MARKET_DB_POSTGRES
// Runs on its own connection: the pool prepares statements against the
// tables, so the schema has to exist first.
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::connection& conn) : conn_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::work tx(conn_);
    tx.exec(sql);
    tx.commit();
  }

 private:
  pqxx::connection& conn_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MARKET_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), util::DurationOr(database.sqlite().busy_timeout(), 5s));
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    MARKET_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MARKET_DB_POSTGRES
    {
      pqxx::connection          conn(database.postgres().connection_uri());
      PostgresMigrationExecutor executor(conn);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    }
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    MARKET_LOG_INFO("postgres repository ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  MARKET_LOG_WARN("no database configured, market state is in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

market::v1::AuctionKind ToAuctionKind(market::runtime::config::AuctionKindConfig kind) {
  switch (kind) {
    case market::runtime::config::AUCTION_KIND_CONFIG_FIRST_PRICE:
      return market::v1::AUCTION_KIND_FIRST_PRICE;
    case market::runtime::config::AUCTION_KIND_CONFIG_RESERVE:
      return market::v1::AUCTION_KIND_RESERVE;
    default:
      return market::v1::AUCTION_KIND_SECOND_PRICE;
  }
}

discovery::IndexOptions IndexOptionsFrom(const RuntimeConfig& config) {
  discovery::IndexOptions options;
  const auto&             d = config.discovery();
  if (d.default_limit() > 0) options.default_limit = d.default_limit();
  if (d.default_max_utilization() > 0.0) options.default_max_utilization = d.default_max_utilization();
  if (d.response_time_baseline_ms() > 0.0) options.response_time_baseline_ms = d.response_time_baseline_ms();
  if (config.health().failure_threshold() > 0) options.failure_threshold = config.health().failure_threshold();
  if (config.health().ewma_alpha() > 0.0) options.ewma_alpha = config.health().ewma_alpha();
  return options;
}

auction::AuctionOptions AuctionOptionsFrom(const market::runtime::config::AuctionConfig& a) {
  auction::AuctionOptions options;
  options.default_kind     = ToAuctionKind(a.default_kind());
  options.default_duration = util::DurationOr(a.default_duration(), options.default_duration);
  options.sweep_interval   = util::DurationOr(a.sweep_interval(), options.sweep_interval);
  options.retention        = util::DurationOr(a.retention(), options.retention);
  if (a.min_bidders() > 0) options.min_bidders = a.min_bidders();
  return options;
}

ledger::LedgerOptions LedgerOptionsFrom(const market::runtime::config::LedgerConfig& l) {
  ledger::LedgerOptions options;
  if (l.has_verify_after_mutation()) {
    options.verify_after_mutation = l.verify_after_mutation();
  }
  options.max_escrow_hold = util::DurationOr(l.max_escrow_hold(), options.max_escrow_hold);
  return options;
}

settlement::ReputationPolicyOptions PolicyOptionsFrom(const market::runtime::config::SettlementConfig& s) {
  settlement::ReputationPolicyOptions options;
  if (s.success_delta() > 0.0) options.success_delta = s.success_delta();
  if (s.efficiency_bonus() > 0.0) options.efficiency_bonus = s.efficiency_bonus();
  if (s.efficiency_threshold() > 0.0) options.efficiency_threshold = s.efficiency_threshold();
  if (s.failure_penalty() > 0.0) options.failure_penalty = s.failure_penalty();
  if (s.failure_penalty_mode() == market::runtime::config::FAILURE_PENALTY_MODE_PROPORTIONAL) {
    options.failure_mode = settlement::FailurePenaltyMode::kProportional;
  }
  return options;
}

std::shared_ptr<clients::ReputationClient> BuildReputationClient(const market::runtime::config::CollaboratorsConfig& c) {
  if (c.reputation_address().empty()) {
    MARKET_LOG_INFO("using in-process reputation store");
    return std::make_shared<clients::InMemoryReputationStore>();
  }
  auto channel = ::grpc::CreateChannel(c.reputation_address(), ::grpc::InsecureChannelCredentials());
  return std::make_shared<clients::GrpcReputationClient>(std::move(channel), util::DurationOr(c.rpc_timeout(), 5s));
}

} // namespace

void Application::StartBackground() {
  if (health && health_enabled) {
    health->Start();
  }
  if (auctions) {
    auctions->Start();
  }
  if (reaper) {
    reaper->Start();
  }
}

void Application::StopBackground() {
  if (reaper) {
    reaper->Stop();
  }
  if (auctions) {
    auctions->Stop();
  }
  if (health) {
    health->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------------
  app.index = std::make_shared<discovery::CapabilityIndex>(IndexOptionsFrom(config));

  const auto& auction_config = config.auction();
  auto        transport = std::make_shared<clients::GrpcWorkerTransport>(app.index, util::DurationOr(auction_config.invite_timeout(), 2s));

  discovery::HealthOptions health_options;
  health_options.interval      = util::DurationOr(config.health().interval(), health_options.interval);
  health_options.probe_timeout = util::DurationOr(config.health().probe_timeout(), health_options.probe_timeout);
  app.health                   = std::make_shared<discovery::HealthMonitor>(app.index, transport, health_options);
  app.health_enabled           = config.health().enabled();

  // ------------------------------------------------------------------
  // Auctions and ledger
  // ------------------------------------------------------------------
  app.auctions = std::make_shared<auction::AuctionCoordinator>(transport, app.repository, app.index, AuctionOptionsFrom(auction_config));

  app.ledger = std::make_shared<ledger::EscrowLedger>(app.repository, LedgerOptionsFrom(config.ledger()));
  app.ledger->Hydrate();

  settlement::ReaperOptions reaper_options;
  reaper_options.interval = util::DurationOr(config.ledger().reaper_interval(), reaper_options.interval);
  app.reaper              = std::make_shared<settlement::EscrowReaper>(app.ledger, reaper_options);

  // ------------------------------------------------------------------
  // Settlement and orchestration
  // ------------------------------------------------------------------
  const auto& collaborators = config.collaborators();
  auto        reputation    = BuildReputationClient(collaborators);
  auto        settlement    = std::make_shared<settlement::SettlementCoordinator>(
      app.ledger, reputation, app.index, settlement::ReputationPolicy(PolicyOptionsFrom(config.settlement())));
  auto execution = std::make_shared<clients::GrpcExecutionClient>(collaborators.execution_address(), app.index);

  core::OrchestratorOptions orchestrator_options;
  if (config.discovery().candidate_limit() > 0) {
    orchestrator_options.candidate_limit = config.discovery().candidate_limit();
  }
  orchestrator_options.default_task_timeout =
      util::DurationOr(config.settlement().default_task_timeout(), orchestrator_options.default_task_timeout);
  app.orchestrator = std::make_shared<core::MarketplaceOrchestrator>(app.index, app.auctions, settlement, execution, orchestrator_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.index        = app.index;
  ctx.auctions     = app.auctions;
  ctx.ledger       = app.ledger;
  ctx.orchestrator = app.orchestrator;
  ctx.repository   = app.repository;
  ctx.reputation   = reputation;

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DiscoveryServer>(std::make_shared<service::DiscoveryService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AuctionServer>(std::make_shared<service::AuctionService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(std::make_shared<service::LedgerService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AllocationServer>(std::make_shared<service::AllocationService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));

  return app;
}

} // namespace market::factory
