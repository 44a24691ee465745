#pragma once

#include "internal/auction/auction_types.hpp"
#include "internal/discovery/worker_record.hpp"
#include "internal/ledger/ledger_types.hpp"
#include "market/v1.hpp"

namespace market::service {

/*
  Conversions between wire messages and the component types.
*/

market::v1::Worker        ToProto(const discovery::WorkerRecord& worker);
discovery::WorkerRecord   FromProto(const market::v1::Worker& worker);
discovery::DiscoveryQuery FromProto(const market::v1::DiscoveryQuery& query);
market::v1::DiscoveryStats ToProto(const discovery::DiscoveryCounts& counts);

auction::AuctionSpec     FromProto(const market::v1::AuctionSpec& spec);
market::v1::AuctionSpec  ToProto(const auction::AuctionSpec& spec);
market::v1::Bid          ToProto(const auction::Bid& bid);
market::v1::Auction      ToProto(const auction::AuctionSnapshot& snapshot);
market::v1::AuctionStats ToProto(const auction::AuctionStats& stats);

market::v1::Account        ToProto(const ledger::Account& account);
market::v1::PaymentChannel ToProto(const ledger::Channel& channel);
market::v1::LedgerStats    ToProto(const ledger::LedgerStats& stats);

} // namespace market::service
