#pragma once

#include "market/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class LedgerService {
 public:
  explicit LedgerService(ServiceContext ctx);

  market::v1::AccountResponse       Deposit(const market::v1::DepositRequest& req);
  market::v1::AccountResponse       Withdraw(const market::v1::WithdrawRequest& req);
  market::v1::AccountResponse       GetBalance(const market::v1::GetBalanceRequest& req);
  market::v1::GetChannelResponse    GetChannel(const market::v1::GetChannelRequest& req);
  market::v1::VerifyChannelResponse VerifyChannel(const market::v1::VerifyChannelRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace market::service
