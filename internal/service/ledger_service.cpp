#include "ledger_service.hpp"

#include "internal/ledger/escrow_ledger.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace market::service {

using namespace market::v1;

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AccountResponse LedgerService::Deposit(const DepositRequest& req) {
  return ObserveRpc("LedgerService.Deposit", [&] {
    AccountResponse resp;
    *resp.mutable_account() = ToProto(ctx_.ledger->Deposit(req.owner_id(), req.amount_micros()));
    return resp;
  });
}

AccountResponse LedgerService::Withdraw(const WithdrawRequest& req) {
  return ObserveRpc("LedgerService.Withdraw", [&] {
    AccountResponse resp;
    *resp.mutable_account() = ToProto(ctx_.ledger->Withdraw(req.owner_id(), req.amount_micros()));
    return resp;
  });
}

AccountResponse LedgerService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("LedgerService.GetBalance", [&] {
    if (req.owner_id().empty()) {
      throw util::InvalidArgument("get balance: owner_id is required");
    }
    // Unknown owners read as an empty account with a zero balance.
    ledger::Account account;
    account.owner_id = req.owner_id();
    if (auto existing = ctx_.ledger->GetAccount(req.owner_id())) {
      account = std::move(*existing);
    }
    AccountResponse resp;
    *resp.mutable_account() = ToProto(account);
    return resp;
  });
}

GetChannelResponse LedgerService::GetChannel(const GetChannelRequest& req) {
  return ObserveRpc("LedgerService.GetChannel", [&] {
    GetChannelResponse resp;
    *resp.mutable_channel() = ToProto(ctx_.ledger->GetChannel(req.channel_id()));
    return resp;
  });
}

VerifyChannelResponse LedgerService::VerifyChannel(const VerifyChannelRequest& req) {
  return ObserveRpc("LedgerService.VerifyChannel", [&] {
    VerifyChannelResponse resp;
    try {
      ctx_.ledger->VerifyInvariant(req.channel_id());
      resp.set_ok(true);
      if (ctx_.ledger->GetChannel(req.channel_id()).frozen) {
        resp.set_detail("balances hold but the channel is frozen");
      }
    } catch (const util::InvariantViolation& e) {
      // A violation is the answer here, not a failed call.
      resp.set_ok(false);
      resp.set_detail(e.what());
    }
    return resp;
  });
}

} // namespace market::service
