#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "market/v1.hpp"

using namespace market::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  marketctl <addr> register <worker_id> <endpoint> <cap[,cap...]> [region]\n"
            << "  marketctl <addr> unregister <worker_id>\n"
            << "  marketctl <addr> status <worker_id> <online|busy|offline|maintenance>\n"
            << "  marketctl <addr> discover <cap[,cap...]> [min_reputation] [limit]\n"
            << "  marketctl <addr> auction <auction_id>\n"
            << "  marketctl <addr> cancel <auction_id>\n"
            << "  marketctl <addr> bid <auction_id> <worker_id> <price> [estimated_ms]\n"
            << "  marketctl <addr> deposit <owner_id> <amount_micros>\n"
            << "  marketctl <addr> withdraw <owner_id> <amount_micros>\n"
            << "  marketctl <addr> balance <owner_id>\n"
            << "  marketctl <addr> channel <channel_id>\n"
            << "  marketctl <addr> verify <channel_id>\n"
            << "  marketctl <addr> allocate <task_id> <requester_id> <cap[,cap...]> <max_price> [kind=first|second|reserve]\n"
            << "  marketctl <addr> stats\n";
}

static void SplitInto(const std::string& csv, google::protobuf::RepeatedPtrField<std::string>* out) {
  size_t start = 0;
  while (start <= csv.size()) {
    const auto end = csv.find(',', start);
    const auto part = csv.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!part.empty()) {
      out->Add(std::string(part));
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

static std::optional<WorkerStatus> ParseStatus(const std::string& value) {
  if (value == "online") return WORKER_STATUS_ONLINE;
  if (value == "busy") return WORKER_STATUS_BUSY;
  if (value == "offline") return WORKER_STATUS_OFFLINE;
  if (value == "maintenance") return WORKER_STATUS_MAINTENANCE;
  return std::nullopt;
}

static std::optional<AuctionKind> ParseKind(const std::string& value) {
  if (value == "first") return AUCTION_KIND_FIRST_PRICE;
  if (value == "second") return AUCTION_KIND_SECOND_PRICE;
  if (value == "reserve") return AUCTION_KIND_RESERVE;
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintAccount(const Account& account) {
  std::cout << "owner=" << account.owner_id() << " balance=" << account.balance_micros() << " deposited=" << account.total_deposited_micros()
            << " withdrawn=" << account.total_withdrawn_micros() << " earned=" << account.total_earned_micros()
            << " spent=" << account.total_spent_micros() << " committed=" << account.committed_micros() << "\n";
}

static void PrintAuction(const Auction& auction) {
  std::cout << "auction=" << auction.auction_id() << " task=" << auction.spec().task_id() << " status=" << AuctionStatus_Name(auction.status())
            << " bids=" << auction.bids_size();
  if (auction.has_winning_bid()) {
    std::cout << " winner=" << auction.winning_bid().worker_id() << " price=" << auction.final_price();
  }
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto discovery_stub  = MarketDiscoveryService::NewStub(channel);
  auto auction_stub    = MarketAuctionService::NewStub(channel);
  auto ledger_stub     = MarketLedgerService::NewStub(channel);
  auto allocation_stub = MarketAllocationService::NewStub(channel);
  auto admin_stub      = MarketAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "register") {
      if (argc < 6) return 1;

      RegisterWorkerRequest req;
      auto*                 worker = req.mutable_worker();
      worker->set_worker_id(argv[3]);
      worker->set_endpoint(argv[4]);
      SplitInto(argv[5], worker->mutable_capabilities());
      if (argc >= 7) worker->set_region(argv[6]);

      RegisterWorkerResponse resp;
      auto                   status = discovery_stub->RegisterWorker(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "registered " << resp.worker().worker_id() << " status=" << WorkerStatus_Name(resp.worker().status())
                << " reputation=" << resp.worker().reputation() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "unregister") {
      if (argc < 4) return 1;

      UnregisterWorkerRequest req;
      req.set_worker_id(argv[3]);
      UnregisterWorkerResponse resp;
      auto                     status = discovery_stub->UnregisterWorker(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "unregistered\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "status") {
      if (argc < 5) return 1;

      auto parsed = ParseStatus(argv[4]);
      if (!parsed) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }

      UpdateWorkerStatusRequest req;
      req.set_worker_id(argv[3]);
      req.set_status(*parsed);
      UpdateWorkerStatusResponse resp;
      auto                       status = discovery_stub->UpdateWorkerStatus(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << resp.worker().worker_id() << " status=" << WorkerStatus_Name(resp.worker().status()) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "discover") {
      if (argc < 4) return 1;

      DiscoverRequest req;
      SplitInto(argv[3], req.mutable_query()->mutable_capabilities());
      if (argc >= 5) req.mutable_query()->set_min_reputation(std::stod(argv[4]));
      if (argc >= 6) req.mutable_query()->set_limit(static_cast<uint32_t>(std::stoul(argv[5])));

      DiscoverResponse resp;
      auto             status = discovery_stub->Discover(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& match : resp.matches()) {
        std::cout << match.worker().worker_id() << " score=" << match.score() << " reputation=" << match.worker().reputation()
                  << " load=" << match.worker().load() << "/" << match.worker().capacity() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "auction") {
      if (argc < 4) return 1;

      GetAuctionStatusRequest req;
      req.set_auction_id(argv[3]);
      GetAuctionStatusResponse resp;
      auto                     status = auction_stub->GetAuctionStatus(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintAuction(resp.auction());
      return 0;
    }

    if (cmd == "cancel") {
      if (argc < 4) return 1;

      CancelAuctionRequest req;
      req.set_auction_id(argv[3]);
      CancelAuctionResponse resp;
      auto                  status = auction_stub->CancelAuction(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintAuction(resp.auction());
      return 0;
    }

    if (cmd == "bid") {
      if (argc < 6) return 1;

      SubmitBidRequest req;
      req.set_auction_id(argv[3]);
      req.set_worker_id(argv[4]);
      req.set_price(std::stod(argv[5]));
      if (argc >= 7) req.set_estimated_completion_ms(std::stoull(argv[6]));

      SubmitBidResponse resp;
      auto              status = auction_stub->SubmitBid(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "bid=" << resp.bid_id() << " sequence=" << resp.sequence() << " score=" << resp.score()
                << " auction_status=" << AuctionStatus_Name(resp.status()) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "deposit" || cmd == "withdraw") {
      if (argc < 5) return 1;

      AccountResponse resp;
      grpc::Status    status;
      if (cmd == "deposit") {
        DepositRequest req;
        req.set_owner_id(argv[3]);
        req.set_amount_micros(std::stoll(argv[4]));
        status = ledger_stub->Deposit(&ctx, req, &resp);
      } else {
        WithdrawRequest req;
        req.set_owner_id(argv[3]);
        req.set_amount_micros(std::stoll(argv[4]));
        status = ledger_stub->Withdraw(&ctx, req, &resp);
      }
      if (!status.ok()) return Fail(status);

      PrintAccount(resp.account());
      return 0;
    }

    if (cmd == "balance") {
      if (argc < 4) return 1;

      GetBalanceRequest req;
      req.set_owner_id(argv[3]);
      AccountResponse resp;
      auto            status = ledger_stub->GetBalance(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintAccount(resp.account());
      return 0;
    }

    if (cmd == "channel") {
      if (argc < 4) return 1;

      GetChannelRequest req;
      req.set_channel_id(argv[3]);
      GetChannelResponse resp;
      auto               status = ledger_stub->GetChannel(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& c = resp.channel();
      std::cout << "channel=" << c.channel_id() << " state=" << ChannelState_Name(c.state()) << " deposit=" << c.total_deposit_micros()
                << " balance=" << c.current_balance_micros() << " escrowed=" << c.escrowed_micros() << " settled=" << c.total_settled_micros()
                << " refunded=" << c.total_refunded_micros() << " sequence=" << c.sequence() << (c.frozen() ? " frozen" : "") << "\n";
      for (const auto& entry : c.entries()) {
        std::cout << "  #" << entry.sequence() << " " << LedgerEntryType_Name(entry.type()) << " amount=" << entry.amount_micros()
                  << " task=" << entry.task_id() << " reason=" << entry.reason() << "\n";
      }
      return 0;
    }

    if (cmd == "verify") {
      if (argc < 4) return 1;

      VerifyChannelRequest req;
      req.set_channel_id(argv[3]);
      VerifyChannelResponse resp;
      auto                  status = ledger_stub->VerifyChannel(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.ok() ? "ok" : "violation") << (resp.detail().empty() ? "" : ": " + resp.detail()) << "\n";
      return resp.ok() ? 0 : 3;
    }

    // ------------------------------------------------------------

    if (cmd == "allocate") {
      if (argc < 7) return 1;

      AllocateAndSettleRequest req;
      auto*                    task = req.mutable_task();
      task->set_task_id(argv[3]);
      task->set_requester_id(argv[4]);
      SplitInto(argv[5], task->mutable_capabilities());
      task->set_max_price(std::stod(argv[6]));
      if (argc >= 8) {
        auto kind = ParseKind(argv[7]);
        if (!kind) {
          std::cerr << "unsupported auction kind: " << argv[7] << "\n";
          return 1;
        }
        task->set_auction_kind(*kind);
      }

      AllocateAndSettleResponse resp;
      auto                      status = allocation_stub->AllocateAndSettle(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& r = resp.result();
      std::cout << "outcome=" << AllocationOutcome_Name(r.outcome());
      if (r.outcome() == ALLOCATION_OUTCOME_NOT_ALLOCATED) {
        std::cout << " reason=" << NotAllocatedReason_Name(r.reason()) << " detail=" << r.detail() << "\n";
        return 0;
      }
      std::cout << " worker=" << r.worker_id() << " price=" << r.final_price() << " settled=" << r.settled_micros()
                << " refunded=" << r.refunded_micros() << " reputation_delta=" << r.reputation_delta() << " duration_ms=" << r.duration_ms()
                << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;
      auto          status = admin_stub->Stats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "workers registered=" << resp.discovery().registered() << " online=" << resp.discovery().online()
                << " busy=" << resp.discovery().busy() << " offline=" << resp.discovery().offline() << "\n"
                << "auctions created=" << resp.auctions().created() << " open=" << resp.auctions().open()
                << " awarded=" << resp.auctions().awarded() << " bids=" << resp.auctions().bids_received() << "\n"
                << "ledger accounts=" << resp.ledger().accounts() << " channels_opened=" << resp.ledger().channels_opened()
                << " channels_closed=" << resp.ledger().channels_closed() << " locked=" << resp.ledger().escrow_locked_micros()
                << " released=" << resp.ledger().escrow_released_micros() << " refunded=" << resp.ledger().escrow_refunded_micros()
                << " violations=" << resp.ledger().invariant_violations() << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
