#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ledger_service.hpp"
#include "market/v1.hpp"

namespace market::grpc {

class LedgerServer final : public market::v1::MarketLedgerService::Service {
 public:
  explicit LedgerServer(std::shared_ptr<market::service::LedgerService> svc);

  ::grpc::Status Deposit(::grpc::ServerContext*, const market::v1::DepositRequest*, market::v1::AccountResponse*) override;
  ::grpc::Status Withdraw(::grpc::ServerContext*, const market::v1::WithdrawRequest*, market::v1::AccountResponse*) override;
  ::grpc::Status GetBalance(::grpc::ServerContext*, const market::v1::GetBalanceRequest*, market::v1::AccountResponse*) override;
  ::grpc::Status GetChannel(::grpc::ServerContext*, const market::v1::GetChannelRequest*, market::v1::GetChannelResponse*) override;
  ::grpc::Status VerifyChannel(::grpc::ServerContext*, const market::v1::VerifyChannelRequest*, market::v1::VerifyChannelResponse*) override;

 private:
  std::shared_ptr<market::service::LedgerService> service_;
};

} // namespace market::grpc
