#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/clients/in_memory_reputation_store.hpp"
#include "internal/core/marketplace_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/discovery/capability_index.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/allocation_server.hpp"
#include "internal/grpc/auction_server.hpp"
#include "internal/grpc/discovery_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/ledger/escrow_ledger.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/allocation_service.hpp"
#include "internal/service/auction_service.hpp"
#include "internal/service/discovery_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/settlement/settlement_coordinator.hpp"
#include "market/v1.hpp"
#include "support/fake_collaborators.hpp"

namespace {

using namespace market::v1;

market::service::ServiceContext BuildServiceContext(
    std::shared_ptr<market::clients::InMemoryReputationStore> reputation = std::make_shared<market::clients::InMemoryReputationStore>(50.0)) {
  market::service::ServiceContext ctx;
  auto repository = std::make_shared<market::db::memory::MemoryRepository>();
  auto transport  = std::make_shared<market::testing::FakeTransport>();
  ctx.repository  = repository;
  ctx.reputation  = reputation;
  ctx.index       = std::make_shared<market::discovery::CapabilityIndex>();
  ctx.ledger      = std::make_shared<market::ledger::EscrowLedger>(repository);
  ctx.auctions    = std::make_shared<market::auction::AuctionCoordinator>(transport, repository, ctx.index);

  auto settlement = std::make_shared<market::settlement::SettlementCoordinator>(ctx.ledger, reputation, ctx.index);
  ctx.orchestrator = std::make_shared<market::core::MarketplaceOrchestrator>(ctx.index, ctx.auctions, settlement,
                                                                            std::make_shared<market::testing::FakeExecutionClient>());
  return ctx;
}

void RegisterWorker(market::service::ServiceContext& ctx, const std::string& id) {
  market::grpc::DiscoveryServer server(std::make_shared<market::service::DiscoveryService>(ctx));

  RegisterWorkerRequest req;
  req.mutable_worker()->set_worker_id(id);
  req.mutable_worker()->add_capabilities("nlp.summarize");
  req.mutable_worker()->set_capacity(4);
  req.mutable_worker()->set_reputation(80.0);
  RegisterWorkerResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.RegisterWorker(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.worker().worker_id() == id);
}

void TestRegisterWithoutCapabilitiesReturnsInvalidArgument() {
  auto                          ctx = BuildServiceContext();
  market::grpc::DiscoveryServer server(std::make_shared<market::service::DiscoveryService>(ctx));

  RegisterWorkerRequest req;
  req.mutable_worker()->set_worker_id("worker-1");
  RegisterWorkerResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.RegisterWorker(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestRegisterTakesReputationFromReputationService() {
  auto store = std::make_shared<market::clients::InMemoryReputationStore>(50.0);
  store->SetScore("inflated", 10.0);
  auto                          ctx = BuildServiceContext(store);
  market::grpc::DiscoveryServer server(std::make_shared<market::service::DiscoveryService>(ctx));

  RegisterWorkerRequest req;
  req.mutable_worker()->set_worker_id("inflated");
  req.mutable_worker()->add_capabilities("nlp.summarize");
  req.mutable_worker()->set_reputation(100.0);
  RegisterWorkerResponse resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.RegisterWorker(&grpc_ctx, &req, &resp).ok());
  }
  assert(resp.worker().reputation() == 10.0);
  assert(ctx.index->Get("inflated")->reputation == 10.0);

  DiscoverRequest discover_req;
  discover_req.mutable_query()->add_capabilities("nlp.summarize");
  discover_req.mutable_query()->set_min_reputation(50.0);
  DiscoverResponse      discover_resp;
  ::grpc::ServerContext discover_ctx;
  assert(server.Discover(&discover_ctx, &discover_req, &discover_resp).ok());
  assert(discover_resp.matches_size() == 0);
}

void TestRegisterWithoutReputationServiceReturnsUnavailable() {
  auto ctx       = BuildServiceContext();
  ctx.reputation = nullptr;
  market::grpc::DiscoveryServer server(std::make_shared<market::service::DiscoveryService>(ctx));

  RegisterWorkerRequest req;
  req.mutable_worker()->set_worker_id("worker-1");
  req.mutable_worker()->add_capabilities("nlp.summarize");
  RegisterWorkerResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  assert(server.RegisterWorker(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ctx.index->Counts().registered == 0);
}

void TestUpdateUnknownWorkerReturnsNotFound() {
  auto                          ctx = BuildServiceContext();
  market::grpc::DiscoveryServer server(std::make_shared<market::service::DiscoveryService>(ctx));

  UpdateWorkerStatusRequest req;
  req.set_worker_id("ghost");
  req.set_status(WORKER_STATUS_BUSY);
  UpdateWorkerStatusResponse resp;
  ::grpc::ServerContext      grpc_ctx;

  const auto status = server.UpdateWorkerStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestGetMissingChannelReturnsNotFound() {
  auto                       ctx = BuildServiceContext();
  market::grpc::LedgerServer server(std::make_shared<market::service::LedgerService>(ctx));

  GetChannelRequest req;
  req.set_channel_id("missing-channel");
  GetChannelResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetChannel(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestNegativeDepositReturnsInvalidArgument() {
  auto                       ctx = BuildServiceContext();
  market::grpc::LedgerServer server(std::make_shared<market::service::LedgerService>(ctx));

  DepositRequest req;
  req.set_owner_id("requester");
  req.set_amount_micros(-5);
  AccountResponse       resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Deposit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestOverdrawnWithdrawReturnsResourceExhausted() {
  auto                       ctx = BuildServiceContext();
  market::grpc::LedgerServer server(std::make_shared<market::service::LedgerService>(ctx));

  {
    DepositRequest req;
    req.set_owner_id("requester");
    req.set_amount_micros(1'000);
    AccountResponse       resp;
    ::grpc::ServerContext grpc_ctx;
    assert(server.Deposit(&grpc_ctx, &req, &resp).ok());
    assert(resp.account().balance_micros() == 1'000);
  }

  WithdrawRequest req;
  req.set_owner_id("requester");
  req.set_amount_micros(5'000);
  AccountResponse       resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Withdraw(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  GetBalanceRequest     balance_req;
  balance_req.set_owner_id("requester");
  AccountResponse       balance_resp;
  ::grpc::ServerContext balance_ctx;
  assert(server.GetBalance(&balance_ctx, &balance_req, &balance_resp).ok());
  assert(balance_resp.account().balance_micros() == 1'000);
}

void TestUnknownAccountBalanceReadsZero() {
  auto                       ctx = BuildServiceContext();
  market::grpc::LedgerServer server(std::make_shared<market::service::LedgerService>(ctx));

  GetBalanceRequest req;
  req.set_owner_id("nobody");
  AccountResponse       resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.GetBalance(&grpc_ctx, &req, &resp).ok());
  assert(resp.account().owner_id() == "nobody");
  assert(resp.account().balance_micros() == 0);
  assert(resp.account().total_deposited_micros() == 0);
}

void TestCancelClosedAuctionReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  RegisterWorker(ctx, "worker-1");
  market::grpc::AuctionServer server(std::make_shared<market::service::AuctionService>(ctx));

  CreateAuctionRequest create_req;
  auto*                spec = create_req.mutable_spec();
  spec->set_task_id("task-1");
  spec->set_requester_id("requester");
  spec->set_kind(AUCTION_KIND_FIRST_PRICE);
  spec->add_capabilities("nlp.summarize");
  spec->set_max_price(1.0);
  spec->set_duration_ms(60'000);
  spec->add_candidate_ids("worker-1");
  CreateAuctionResponse create_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateAuction(&grpc_ctx, &create_req, &create_resp).ok());
  }
  assert(!create_resp.auction_id().empty());

  CancelAuctionRequest cancel_req;
  cancel_req.set_auction_id(create_resp.auction_id());
  {
    CancelAuctionResponse cancel_resp;
    ::grpc::ServerContext grpc_ctx;
    assert(server.CancelAuction(&grpc_ctx, &cancel_req, &cancel_resp).ok());
    assert(cancel_resp.auction().status() == AUCTION_STATUS_CANCELED);
  }

  CancelAuctionResponse again_resp;
  ::grpc::ServerContext again_ctx;
  const auto            status = server.CancelAuction(&again_ctx, &cancel_req, &again_resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  SubmitBidRequest bid_req;
  bid_req.set_auction_id(create_resp.auction_id());
  bid_req.set_worker_id("worker-1");
  bid_req.set_price(0.5);
  SubmitBidResponse     bid_resp;
  ::grpc::ServerContext bid_ctx;
  assert(server.SubmitBid(&bid_ctx, &bid_req, &bid_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUninvitedBidReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  RegisterWorker(ctx, "worker-1");
  market::grpc::AuctionServer server(std::make_shared<market::service::AuctionService>(ctx));

  CreateAuctionRequest create_req;
  auto*                spec = create_req.mutable_spec();
  spec->set_task_id("task-2");
  spec->set_kind(AUCTION_KIND_FIRST_PRICE);
  spec->add_capabilities("nlp.summarize");
  spec->set_max_price(1.0);
  spec->set_duration_ms(60'000);
  spec->add_candidate_ids("worker-1");
  CreateAuctionResponse create_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateAuction(&grpc_ctx, &create_req, &create_resp).ok());
  }

  SubmitBidRequest bid_req;
  bid_req.set_auction_id(create_resp.auction_id());
  bid_req.set_worker_id("stranger");
  bid_req.set_price(0.5);
  SubmitBidResponse     bid_resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.SubmitBid(&grpc_ctx, &bid_req, &bid_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnknownAuctionReturnsNotFound() {
  auto                        ctx = BuildServiceContext();
  market::grpc::AuctionServer server(std::make_shared<market::service::AuctionService>(ctx));

  GetAuctionStatusRequest req;
  req.set_auction_id("missing-auction");
  GetAuctionStatusResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  assert(server.GetAuctionStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAllocateWithoutTaskReturnsInvalidArgument() {
  auto                           ctx = BuildServiceContext();
  market::grpc::AllocationServer server(std::make_shared<market::service::AllocationService>(ctx));

  AllocateAndSettleRequest  req;
  AllocateAndSettleResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  assert(server.AllocateAndSettle(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestStatsReportsCounts() {
  auto ctx = BuildServiceContext();
  RegisterWorker(ctx, "worker-1");
  RegisterWorker(ctx, "worker-2");
  market::grpc::AdminServer server(std::make_shared<market::service::AdminService>(ctx));

  StatsRequest          req;
  StatsResponse         resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.Stats(&grpc_ctx, &req, &resp).ok());
  assert(resp.discovery().registered() == 2);
}

} // namespace

int main() {
  TestRegisterWithoutCapabilitiesReturnsInvalidArgument();
  TestRegisterTakesReputationFromReputationService();
  TestRegisterWithoutReputationServiceReturnsUnavailable();
  TestUpdateUnknownWorkerReturnsNotFound();
  TestGetMissingChannelReturnsNotFound();
  TestNegativeDepositReturnsInvalidArgument();
  TestOverdrawnWithdrawReturnsResourceExhausted();
  TestUnknownAccountBalanceReadsZero();
  TestCancelClosedAuctionReturnsFailedPrecondition();
  TestUninvitedBidReturnsInvalidArgument();
  TestUnknownAuctionReturnsNotFound();
  TestAllocateWithoutTaskReturnsInvalidArgument();
  TestStatsReportsCounts();

  std::cout << "market_unit_grpc_status: pass\n";
  return 0;
}
