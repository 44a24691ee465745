#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

LedgerServer::LedgerServer(std::shared_ptr<market::service::LedgerService> svc) : service_(std::move(svc)) {
}

::grpc::Status LedgerServer::Deposit(::grpc::ServerContext*, const market::v1::DepositRequest* req, market::v1::AccountResponse* resp) {
  try {
    *resp = service_->Deposit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Withdraw(::grpc::ServerContext*, const market::v1::WithdrawRequest* req, market::v1::AccountResponse* resp) {
  try {
    *resp = service_->Withdraw(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetBalance(::grpc::ServerContext*, const market::v1::GetBalanceRequest* req, market::v1::AccountResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetChannel(::grpc::ServerContext*, const market::v1::GetChannelRequest* req, market::v1::GetChannelResponse* resp) {
  try {
    *resp = service_->GetChannel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::VerifyChannel(::grpc::ServerContext*, const market::v1::VerifyChannelRequest* req, market::v1::VerifyChannelResponse* resp) {
  try {
    *resp = service_->VerifyChannel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
