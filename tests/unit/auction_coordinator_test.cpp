#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_collaborators.hpp"

namespace {

using market::auction::AuctionCoordinator;
using market::auction::AuctionOptions;
using market::auction::AuctionSpec;
using market::auction::BidSubmission;
using market::testing::FakeTransport;
using namespace std::chrono_literals;

AuctionSpec MakeSpec(const std::string& task_id, std::vector<std::string> candidates, market::v1::AuctionKind kind = market::v1::AUCTION_KIND_SECOND_PRICE) {
  AuctionSpec spec;
  spec.task_id       = task_id;
  spec.requester_id  = "requester";
  spec.kind          = kind;
  spec.capabilities  = {"vision"};
  spec.max_price     = 100.0;
  spec.duration      = 5s;
  spec.task_timeout  = 10s;
  spec.candidate_ids = std::move(candidates);
  return spec;
}

BidSubmission MakeBid(const std::string& worker_id, double price, double reputation, double quality) {
  BidSubmission bid;
  bid.worker_id  = worker_id;
  bid.price      = price;
  bid.reputation = reputation;
  bid.quality    = quality;
  return bid;
}

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestSecondPriceChargesSecondHighestQuote() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  const auto         id = coordinator.CreateAuction(MakeSpec("task-vickrey", {"w50", "w45", "w40"}));

  coordinator.SubmitBid(id, MakeBid("w50", 50.0, 100, 100));
  coordinator.SubmitBid(id, MakeBid("w45", 45.0, 10, 10));
  const auto ack = coordinator.SubmitBid(id, MakeBid("w40", 40.0, 10, 10));
  assert(ack.status == market::v1::AUCTION_STATUS_AWARDED);

  const auto outcome = coordinator.GetAuction(id);
  assert(outcome.status == market::v1::AUCTION_STATUS_AWARDED);
  assert(outcome.winning_bid->worker_id == "w50");
  assert(outcome.final_price == 45.0);
}

void TestFirstPriceChargesOwnQuote() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  const auto         id = coordinator.CreateAuction(MakeSpec("task-first", {"a", "b", "c"}, market::v1::AUCTION_KIND_FIRST_PRICE));

  coordinator.SubmitBid(id, MakeBid("a", 20.0, 80, 80));
  coordinator.SubmitBid(id, MakeBid("b", 30.0, 80, 80));
  coordinator.SubmitBid(id, MakeBid("c", 45.0, 80, 80));

  const auto outcome = coordinator.GetAuction(id);
  assert(outcome.winning_bid->worker_id == "a");
  assert(outcome.final_price == 20.0);
}

void TestReservePriceFloorsClearingPrice() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  auto               spec = MakeSpec("task-reserve", {"a", "b", "c"}, market::v1::AUCTION_KIND_RESERVE);
  spec.reserve_price      = 35.0;
  const auto id           = coordinator.CreateAuction(spec);

  coordinator.SubmitBid(id, MakeBid("a", 20.0, 80, 80));
  coordinator.SubmitBid(id, MakeBid("b", 30.0, 80, 80));
  coordinator.SubmitBid(id, MakeBid("c", 45.0, 80, 80));

  const auto outcome = coordinator.GetAuction(id);
  assert(outcome.winning_bid->worker_id == "a");
  assert(outcome.final_price == 35.0);
}

void TestCompositeScoreIncludesSpeed() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  const auto         id = coordinator.CreateAuction(MakeSpec("task-speed", {"fast", "slow", "unknown"}));

  auto fast                 = MakeBid("fast", 50.0, 50, 50);
  fast.estimated_completion = 2s; // 1 - 2/10
  const auto ack            = coordinator.SubmitBid(id, fast);
  assert(std::abs(ack.score - (0.40 * 0.5 + 0.30 * 0.5 + 0.20 * 0.5 + 0.10 * 0.8)) < 1e-9);

  auto unknown     = MakeBid("unknown", 50.0, 50, 50);
  const auto other = coordinator.SubmitBid(id, unknown);
  assert(std::abs(other.score - 0.45) < 1e-9);
}

void TestTieGoesToEarliestBid() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  const auto         id = coordinator.CreateAuction(MakeSpec("task-tie", {"first", "second", "third"}));

  coordinator.SubmitBid(id, MakeBid("first", 30.0, 80, 80));
  coordinator.SubmitBid(id, MakeBid("second", 30.0, 80, 80));
  coordinator.SubmitBid(id, MakeBid("third", 30.0, 80, 80));

  const auto outcome = coordinator.GetAuction(id);
  assert(outcome.winning_bid->worker_id == "first");
  assert(outcome.winning_bid->sequence == 1);
}

void TestInsufficientBiddersAndEmptyAuction() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());

  const auto thin = coordinator.CreateAuction(MakeSpec("task-thin", {"a", "b", "c", "d"}));
  coordinator.SubmitBid(thin, MakeBid("a", 10.0, 80, 80));
  coordinator.SubmitBid(thin, MakeBid("b", 12.0, 80, 80));
  const auto closed = coordinator.CloseAuction(thin);
  assert(closed.status == market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS);
  assert(!closed.winning_bid);

  // Idempotent on terminal auctions.
  assert(coordinator.CloseAuction(thin).status == market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS);

  auto spec     = MakeSpec("task-silent", {"a", "b", "c"});
  spec.duration = 20ms;
  const auto id = coordinator.CreateAuction(spec);
  const auto outcome = coordinator.AwaitOutcome(id);
  assert(outcome.status == market::v1::AUCTION_STATUS_EXPIRED);

  const auto stats = coordinator.Stats();
  assert(stats.created == 2);
  assert(stats.insufficient == 1);
  assert(stats.expired == 1);
  assert(stats.open == 0);
}

void TestMinBiddersOverride() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  auto               spec = MakeSpec("task-min", {"a", "b"});
  spec.min_bidders        = 2;
  const auto id           = coordinator.CreateAuction(spec);

  coordinator.SubmitBid(id, MakeBid("a", 10.0, 80, 80));
  const auto ack = coordinator.SubmitBid(id, MakeBid("b", 12.0, 80, 80));
  assert(ack.status == market::v1::AUCTION_STATUS_AWARDED);
}

void TestBidValidation() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  auto               spec = MakeSpec("task-validate", {"a", "b", "c", "d"});
  spec.min_reputation     = 50.0;
  const auto id           = coordinator.CreateAuction(spec);

  ExpectThrows<market::util::InvalidBid>([&] { coordinator.SubmitBid(id, MakeBid("a", 0.0, 80, 80)); });
  ExpectThrows<market::util::InvalidBid>([&] { coordinator.SubmitBid(id, MakeBid("a", 100.5, 80, 80)); });
  ExpectThrows<market::util::InvalidBid>([&] { coordinator.SubmitBid(id, MakeBid("a", 10.0, 20, 80)); });
  ExpectThrows<market::util::InvalidBid>([&] { coordinator.SubmitBid(id, MakeBid("outsider", 10.0, 80, 80)); });

  coordinator.SubmitBid(id, MakeBid("a", 10.0, 80, 80));
  ExpectThrows<market::util::InvalidBid>([&] { coordinator.SubmitBid(id, MakeBid("a", 9.0, 80, 80)); });

  ExpectThrows<market::util::NotFound>([&] { coordinator.SubmitBid("auction-missing", MakeBid("a", 10.0, 80, 80)); });

  coordinator.CancelAuction(id);
  ExpectThrows<market::util::AuctionClosed>([&] { coordinator.SubmitBid(id, MakeBid("b", 10.0, 80, 80)); });
  ExpectThrows<market::util::AuctionClosed>([&] { coordinator.CancelAuction(id); });
  assert(coordinator.Stats().canceled == 1);
}

void TestLateBidResolvesAndReportsExpiry() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());
  auto               spec = MakeSpec("task-late", {"a", "b", "c"});
  spec.duration           = 10ms;
  const auto id           = coordinator.CreateAuction(spec);

  std::this_thread::sleep_for(30ms);
  ExpectThrows<market::util::AuctionExpired>([&] { coordinator.SubmitBid(id, MakeBid("a", 10.0, 80, 80)); });
  assert(coordinator.GetAuction(id).status == market::v1::AUCTION_STATUS_EXPIRED);
  ExpectThrows<market::util::AuctionClosed>([&] { coordinator.SubmitBid(id, MakeBid("a", 10.0, 80, 80)); });
}

void TestCreateValidation() {
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>());

  ExpectThrows<market::util::NoEligibleWorkers>([&] { coordinator.CreateAuction(MakeSpec("task-empty", {})); });

  auto no_task    = MakeSpec("", {"a"});
  ExpectThrows<market::util::InvalidArgument>([&] { coordinator.CreateAuction(no_task); });

  auto no_window     = MakeSpec("task-window", {"a"});
  no_window.duration = 0ms;
  ExpectThrows<market::util::InvalidArgument>([&] { coordinator.CreateAuction(no_window); });

  auto bad_reserve          = MakeSpec("task-reserve", {"a"});
  bad_reserve.reserve_price = 150.0;
  ExpectThrows<market::util::InvalidArgument>([&] { coordinator.CreateAuction(bad_reserve); });

  auto no_price      = MakeSpec("task-price", {"a"});
  no_price.max_price = 0.0;
  ExpectThrows<market::util::InvalidArgument>([&] { coordinator.CreateAuction(no_price); });

  assert(coordinator.Stats().created == 0);
}

void TestInviteCarriesAuctionTerms() {
  auto               transport = std::make_shared<FakeTransport>();
  AuctionCoordinator coordinator(transport);
  auto               spec = MakeSpec("task-invite", {"b", "a", "a"});
  const auto         id   = coordinator.CreateAuction(spec);

  assert(transport->InviteCount() == 1);
  const auto invitees = transport->LastInvitees();
  assert(invitees.size() == 2);
  assert(invitees[0] == "a" && invitees[1] == "b");
  assert(coordinator.GetAuctionByTask("task-invite")->id == id);
  assert(!coordinator.GetAuctionByTask("task-unknown"));
}

void TestBidsDeliveredDuringBroadcast() {
  auto               transport = std::make_shared<FakeTransport>();
  AuctionCoordinator coordinator(transport);

  transport->OnBroadcast([&coordinator](const std::vector<std::string>& workers, const market::v1::AuctionInvite& invite) {
    double price = 10.0;
    for (const auto& worker : workers) {
      coordinator.SubmitBid(invite.auction_id(), MakeBid(worker, price, 80, 80));
      price += 5.0;
    }
  });

  const auto id = coordinator.CreateAuction(MakeSpec("task-sync", {"a", "b", "c"}));
  const auto outcome = coordinator.AwaitOutcome(id);
  assert(outcome.status == market::v1::AUCTION_STATUS_AWARDED);
  assert(outcome.winning_bid->worker_id == "a");
  assert(outcome.final_price == 15.0);
}

void TestIndexSnapshotOverridesSelfReportedReputation() {
  auto                             index = std::make_shared<market::discovery::CapabilityIndex>();
  market::discovery::WorkerRecord worker;
  worker.id            = "trusted";
  worker.capabilities  = {"vision"};
  worker.reputation    = 90.0;
  worker.quality_score = 70.0;
  index->Register(worker);

  AuctionCoordinator coordinator(std::make_shared<FakeTransport>(), nullptr, index);
  auto               spec = MakeSpec("task-index", {"trusted", "other", "third"});
  spec.min_reputation     = 50.0;
  const auto id           = coordinator.CreateAuction(spec);

  coordinator.SubmitBid(id, MakeBid("trusted", 10.0, 5, 5));

  bool threw = false;
  try {
    coordinator.SubmitBid(id, MakeBid("other", 9.0, 100, 100));
  } catch (const market::util::InvalidBid&) {
    threw = true;
  }
  assert(threw);

  const auto snapshot = coordinator.GetAuction(id);
  assert(snapshot.bids.size() == 1);
  assert(snapshot.bids[0].reputation == 90.0);
  assert(snapshot.bids[0].quality == 70.0);
}

void TestConcurrentBidsResolveOnce() {
  AuctionCoordinator       coordinator(std::make_shared<FakeTransport>());
  std::vector<std::string> workers;
  for (int i = 0; i < 16; ++i) {
    workers.push_back("w" + std::to_string(i));
  }
  const auto id = coordinator.CreateAuction(MakeSpec("task-race", workers));

  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&coordinator, &id, i] { coordinator.SubmitBid(id, MakeBid("w" + std::to_string(i), 10.0 + i, 80, 80)); });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto outcome = coordinator.GetAuction(id);
  assert(outcome.status == market::v1::AUCTION_STATUS_AWARDED);
  assert(outcome.bids.size() == 16);
  assert(outcome.winning_bid->worker_id == "w0");
  assert(coordinator.Stats().awarded == 1);
}

void TestSweepResolvesAndPurgesButHistorySurvives() {
  auto           repository = std::make_shared<market::db::memory::MemoryRepository>();
  AuctionOptions options;
  options.retention = 1min;
  AuctionCoordinator coordinator(std::make_shared<FakeTransport>(), repository, nullptr, options);

  const auto id = coordinator.CreateAuction(MakeSpec("task-sweep", {"a", "b", "c"}));
  coordinator.SubmitBid(id, MakeBid("a", 10.0, 80, 80));

  const auto now = market::util::Now();
  assert(coordinator.SweepOnce(now + 1h) == 1);
  assert(coordinator.GetAuction(id).status == market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS);

  assert(coordinator.SweepOnce(now + 2h) == 0);
  assert(!coordinator.GetAuctionByTask("task-sweep"));

  // Purged from memory; the durable record still answers.
  const auto stored = coordinator.GetAuction(id);
  assert(stored.status == market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS);
  assert(stored.bids.size() == 1);
  assert(stored.bids[0].worker_id == "a");
}

} // namespace

int main() {
  TestSecondPriceChargesSecondHighestQuote();
  TestFirstPriceChargesOwnQuote();
  TestReservePriceFloorsClearingPrice();
  TestCompositeScoreIncludesSpeed();
  TestTieGoesToEarliestBid();
  TestInsufficientBiddersAndEmptyAuction();
  TestMinBiddersOverride();
  TestBidValidation();
  TestLateBidResolvesAndReportsExpiry();
  TestCreateValidation();
  TestInviteCarriesAuctionTerms();
  TestBidsDeliveredDuringBroadcast();
  TestIndexSnapshotOverridesSelfReportedReputation();
  TestConcurrentBidsResolveOnce();
  TestSweepResolvesAndPurgesButHistorySurvives();

  std::cout << "market_unit_auction_coordinator: pass\n";
  return 0;
}
