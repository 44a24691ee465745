#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/clients/in_memory_reputation_store.hpp"
#include "internal/core/marketplace_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/escrow_ledger.hpp"
#include "internal/settlement/settlement_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fake_collaborators.hpp"
#include "support/flaky_repository.hpp"

namespace {

using market::auction::AuctionCoordinator;
using market::auction::AuctionOptions;
using market::auction::BidSubmission;
using market::clients::ExecutionReport;
using market::clients::InMemoryReputationStore;
using market::core::MarketplaceOrchestrator;
using market::discovery::CapabilityIndex;
using market::discovery::WorkerRecord;
using market::ledger::EscrowLedger;
using market::ledger::LedgerOptions;
using market::settlement::SettlementCoordinator;
using market::testing::FakeExecutionClient;
using market::testing::FakeTransport;
using market::testing::FlakyRepository;
using market::v1::ALLOCATION_OUTCOME_NOT_ALLOCATED;
using market::v1::ALLOCATION_OUTCOME_REFUNDED;
using market::v1::ALLOCATION_OUTCOME_SETTLED;
using namespace std::chrono_literals;

struct Quote {
  double price      = 0.0;
  double reputation = 0.0;
};

// A whole marketplace wired in process. Invited workers answer from the
// quote table synchronously inside Broadcast.
struct Market {
  std::shared_ptr<market::db::memory::MemoryRepository> repository = std::make_shared<market::db::memory::MemoryRepository>();
  std::shared_ptr<FlakyRepository>                      ledger_store = std::make_shared<FlakyRepository>(repository);
  std::shared_ptr<FakeTransport>                        transport  = std::make_shared<FakeTransport>();
  std::shared_ptr<CapabilityIndex>                      index      = std::make_shared<CapabilityIndex>();
  std::shared_ptr<InMemoryReputationStore>              reputation = std::make_shared<InMemoryReputationStore>(50.0);
  std::shared_ptr<FakeExecutionClient>                  execution  = std::make_shared<FakeExecutionClient>();
  std::shared_ptr<EscrowLedger>                         ledger;
  std::shared_ptr<AuctionCoordinator>                   auctions;
  std::shared_ptr<SettlementCoordinator>                settlement;
  std::shared_ptr<MarketplaceOrchestrator>              orchestrator;

  std::map<std::string, Quote> quotes;
  std::atomic<bool>            bidding{true};

  explicit Market(AuctionOptions auction_options = {}) {
    LedgerOptions ledger_options;
    ledger_options.verify_after_mutation = true;
    ledger       = std::make_shared<EscrowLedger>(ledger_store, ledger_options);
    auctions     = std::make_shared<AuctionCoordinator>(transport, repository, index, auction_options);
    settlement   = std::make_shared<SettlementCoordinator>(ledger, reputation, index);
    orchestrator = std::make_shared<MarketplaceOrchestrator>(index, auctions, settlement, execution);

    transport->OnBroadcast([this](const std::vector<std::string>& invitees, const market::v1::AuctionInvite& invite) {
      if (!bidding) {
        return;
      }
      for (const auto& worker_id : invitees) {
        auto it = quotes.find(worker_id);
        if (it == quotes.end()) {
          continue;
        }
        BidSubmission bid;
        bid.worker_id  = worker_id;
        bid.price      = it->second.price;
        bid.reputation = it->second.reputation;
        bid.quality    = 80.0;
        auctions->SubmitBid(invite.auction_id(), bid);
      }
    });
  }

  void AddWorker(const std::string& id, double price, double score, uint32_t capacity = 10) {
    WorkerRecord worker;
    worker.id            = id;
    worker.capabilities  = {"vision-analysis"};
    worker.capacity      = capacity;
    worker.reputation    = score;
    worker.quality_score = 80.0;
    index->Register(worker);
    reputation->SetScore(id, score);
    quotes[id] = {price, score};
  }
};

market::v1::TaskSpec Task(const std::string& task_id, const std::string& requester = "requester") {
  market::v1::TaskSpec task;
  task.set_task_id(task_id);
  task.set_requester_id(requester);
  task.add_capabilities("vision-analysis");
  task.set_max_price(0.50);
  task.set_min_reputation(60.0);
  task.set_auction_kind(market::v1::AUCTION_KIND_SECOND_PRICE);
  task.set_auction_duration_ms(2'000);
  task.set_timeout_ms(10'000);
  task.set_input("summarize me");
  return task;
}

void AddStandardWorkers(Market& m) {
  m.AddWorker("cheap", 0.20, 90.0);
  m.AddWorker("middle", 0.30, 70.0);
  m.AddWorker("premium", 0.45, 95.0);
}

void TestSecondPriceAllocationSettles() {
  Market m;
  AddStandardWorkers(m);
  m.ledger->Deposit("requester", 1'000'000);

  const auto result = m.orchestrator->AllocateAndSettle(Task("task-e2e"));
  assert(result.outcome() == ALLOCATION_OUTCOME_SETTLED);
  assert(result.worker_id() == "cheap");
  assert(result.final_price() == 0.30);
  assert(result.settled_micros() == 300'000);
  assert(result.refunded_micros() == 0);
  assert(result.reputation_delta() == 3.0);
  assert(!result.channel_id().empty());

  assert(m.ledger->GetBalance("cheap") == 300'000);
  assert(m.ledger->GetBalance("requester") == 700'000);
  assert(m.ledger->GetChannel(result.channel_id()).state == market::v1::CHANNEL_STATE_CLOSED);
  assert(m.reputation->GetScore("cheap") == 93.0);
  assert(m.index->Get("cheap")->reputation == 93.0);
  assert(m.index->Get("cheap")->load == 0);

  const auto requests = m.execution->Requests();
  assert(requests.size() == 1);
  assert(requests[0].worker_id == "cheap");
  assert(requests[0].input == "summarize me");
  assert(requests[0].timeout == 10s);

  const auto auction = m.auctions->GetAuction(result.auction_id());
  assert(auction.status == market::v1::AUCTION_STATUS_AWARDED);
  assert(auction.bids.size() == 3);
  m.ledger->VerifyAll();
}

void TestFailedExecutionRefunds() {
  Market m;
  AddStandardWorkers(m);
  m.ledger->Deposit("requester", 1'000'000);

  ExecutionReport failed;
  failed.success  = false;
  failed.duration = 3s;
  failed.progress = 0.4;
  failed.error    = "model crashed";
  m.execution->SetReport(failed);

  const auto result = m.orchestrator->AllocateAndSettle(Task("task-fails"));
  assert(result.outcome() == ALLOCATION_OUTCOME_REFUNDED);
  assert(result.refunded_micros() == 300'000);
  assert(result.settled_micros() == 0);
  assert(result.detail() == "model crashed");
  assert(result.reputation_delta() < 0.0);

  assert(m.ledger->GetBalance("requester") == 1'000'000);
  assert(m.ledger->GetBalance("cheap") == 0);
  m.ledger->VerifyAll();
}

void TestUnreachableRuntimeRefunds() {
  Market m;
  AddStandardWorkers(m);
  m.ledger->Deposit("requester", 1'000'000);
  m.execution->SetThrows(true);

  const auto result = m.orchestrator->AllocateAndSettle(Task("task-unreachable"));
  assert(result.outcome() == ALLOCATION_OUTCOME_REFUNDED);
  assert(result.detail() == "execution runtime unreachable");
  assert(m.ledger->GetBalance("requester") == 1'000'000);
}

void TestFailedReleaseFreesWorkerAndLeavesHoldForReaper() {
  Market m;
  m.AddWorker("cheap", 0.20, 90.0, 1);
  m.AddWorker("middle", 0.30, 70.0, 1);
  m.AddWorker("premium", 0.45, 95.0, 1);
  m.ledger->Deposit("requester", 1'000'000);
  m.execution->OnExecute([&](const market::clients::ExecutionRequest&) { m.ledger_store->FailChannelWrites(true); });

  const auto result = m.orchestrator->AllocateAndSettle(Task("task-release-fails"));
  assert(result.outcome() == ALLOCATION_OUTCOME_REFUNDED);
  assert(result.worker_id() == "cheap");
  assert(result.detail().rfind("settlement failed: ", 0) == 0);
  assert(result.settled_micros() == 0);
  assert(result.refunded_micros() == 0);

  const auto worker = *m.index->Get("cheap");
  assert(worker.load == 0);
  assert(worker.status == market::v1::WORKER_STATUS_ONLINE);
  assert(m.reputation->GetScore("cheap") == 90.0);

  auto channel = m.ledger->GetChannel(result.channel_id());
  assert(channel.state == market::v1::CHANNEL_STATE_ESCROWED);
  assert(channel.escrowed == 300'000);
  assert(m.ledger->GetBalance("cheap") == 0);

  m.ledger_store->FailChannelWrites(false);
  const auto expired = m.ledger->ExpireStaleEscrows(market::util::Now() + std::chrono::hours(2));
  assert(expired.size() == 1);
  assert(expired[0].refunded == 300'000);
  m.ledger->CloseChannel(result.channel_id());
  assert(m.ledger->GetBalance("requester") == 1'000'000);
  m.ledger->VerifyAll();
}

void TestNoEligibleWorkers() {
  Market m;
  AddStandardWorkers(m);
  m.ledger->Deposit("requester", 1'000'000);

  auto task = Task("task-nobody");
  task.set_min_reputation(92.0);

  const auto result = m.orchestrator->AllocateAndSettle(task);
  assert(result.outcome() == ALLOCATION_OUTCOME_NOT_ALLOCATED);
  assert(result.reason() == market::v1::NOT_ALLOCATED_REASON_NO_ELIGIBLE_WORKERS);
  assert(result.auction_id().empty());
  assert(m.transport->InviteCount() == 0);
  assert(m.ledger->Stats().channels_opened == 0);
}

void TestInsufficientBidders() {
  Market m;
  AddStandardWorkers(m);
  m.quotes.erase("premium");
  m.ledger->Deposit("requester", 1'000'000);

  auto task = Task("task-quiet");
  task.set_auction_duration_ms(50);

  const auto result = m.orchestrator->AllocateAndSettle(task);
  assert(result.outcome() == ALLOCATION_OUTCOME_NOT_ALLOCATED);
  assert(result.reason() == market::v1::NOT_ALLOCATED_REASON_INSUFFICIENT_BIDDERS);
  assert(!result.auction_id().empty());
  assert(m.ledger->Stats().channels_opened == 0);
  assert(m.execution->Requests().empty());
}

void TestSilentAuctionExpires() {
  Market m;
  AddStandardWorkers(m);
  m.bidding = false;
  m.ledger->Deposit("requester", 1'000'000);

  auto task = Task("task-silent");
  task.set_auction_duration_ms(50);

  const auto result = m.orchestrator->AllocateAndSettle(task);
  assert(result.outcome() == ALLOCATION_OUTCOME_NOT_ALLOCATED);
  assert(result.reason() == market::v1::NOT_ALLOCATED_REASON_AUCTION_EXPIRED);
  assert(m.transport->InviteCount() == 1);
  assert(m.transport->LastInvitees().size() == 3);
}

void TestInsufficientFundsLeavesLedgerUntouched() {
  Market m;
  AddStandardWorkers(m);
  m.ledger->Deposit("requester", 100'000);

  const auto result = m.orchestrator->AllocateAndSettle(Task("task-broke"));
  assert(result.outcome() == ALLOCATION_OUTCOME_NOT_ALLOCATED);
  assert(result.reason() == market::v1::NOT_ALLOCATED_REASON_INSUFFICIENT_FUNDS);
  assert(result.worker_id() == "cheap");
  assert(m.ledger->GetBalance("requester") == 100'000);
  assert(m.ledger->Stats().channels_opened == 0);
  assert(m.index->Get("cheap")->load == 0);
  assert(m.execution->Requests().empty());
}

void TestMalformedTaskIsRejected() {
  Market m;
  AddStandardWorkers(m);

  auto task = Task("task-anon");
  task.clear_requester_id();
  bool threw = false;
  try {
    m.orchestrator->AllocateAndSettle(task);
  } catch (const market::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentAllocationsConserveMoney() {
  AuctionOptions options;
  options.min_bidders = 2;
  Market m(options);
  m.AddWorker("w1", 0.10, 80.0, 100);
  m.AddWorker("w2", 0.15, 80.0, 100);
  m.AddWorker("w3", 0.25, 80.0, 100);

  constexpr int kRequesters = 6;
  constexpr int kTasks      = 4;
  for (int r = 0; r < kRequesters; ++r) {
    m.ledger->Deposit("requester-" + std::to_string(r), 1'000'000);
  }

  std::atomic<int>         settled{0};
  std::vector<std::thread> threads;
  for (int r = 0; r < kRequesters; ++r) {
    threads.emplace_back([&, r] {
      for (int t = 0; t < kTasks; ++t) {
        const auto result =
            m.orchestrator->AllocateAndSettle(Task("task-" + std::to_string(r) + "-" + std::to_string(t), "requester-" + std::to_string(r)));
        if (result.outcome() == ALLOCATION_OUTCOME_SETTLED) {
          ++settled;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(settled == kRequesters * kTasks);

  int64_t paid = 0;
  for (const auto& id : {"w1", "w2", "w3"}) {
    paid += m.ledger->GetBalance(id);
    assert(m.index->Get(id)->load == 0);
  }
  int64_t remaining = 0;
  for (int r = 0; r < kRequesters; ++r) {
    remaining += m.ledger->GetBalance("requester-" + std::to_string(r));
  }
  assert(paid + remaining == kRequesters * 1'000'000);
  assert(m.ledger->Stats().channels_closed == static_cast<uint64_t>(kRequesters * kTasks));
  m.ledger->VerifyAll();
}

} // namespace

int main() {
  TestSecondPriceAllocationSettles();
  TestFailedExecutionRefunds();
  TestUnreachableRuntimeRefunds();
  TestFailedReleaseFreesWorkerAndLeavesHoldForReaper();
  TestNoEligibleWorkers();
  TestInsufficientBidders();
  TestSilentAuctionExpires();
  TestInsufficientFundsLeavesLedgerUntouched();
  TestMalformedTaskIsRejected();
  TestConcurrentAllocationsConserveMoney();

  std::cout << "market_integration_marketplace: pass\n";
  return 0;
}
